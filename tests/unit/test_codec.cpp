#include <gtest/gtest.h>
#include "devagent/codec.hpp"
#include "devagent/error.hpp"

using namespace devagent;

namespace {

int parse_error_code(const std::string& raw) {
    try {
        (void)Codec::parse(raw);
    } catch (const ParseError& e) {
        return e.code;
    }
    return 0;
}

} // namespace

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_object());
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
    EXPECT_FALSE(Codec::is_request(msg));
}

TEST(CodecParse, NullIdIsNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"initialized"})");
    EXPECT_FALSE(Codec::is_request(msg));
}

TEST(CodecParse, IsRequest) {
    EXPECT_TRUE(Codec::is_request(Codec::parse(R"({"jsonrpc":"2.0","id":0,"method":"ping"})")));
}

TEST(CodecParse, NestedParamsSurvive) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"dev_search","arguments":{"query":"auth","limit":5,"tags":["a","b"],"exact":true,"score":0.5,"none":null}}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    const auto& args = req.params->at("arguments");
    EXPECT_EQ(args.at("query"), "auth");
    EXPECT_EQ(args.at("limit"), 5);
    EXPECT_EQ(args.at("tags").size(), 2u);
    EXPECT_TRUE(args.at("exact").get<bool>());
    EXPECT_DOUBLE_EQ(args.at("score").get<double>(), 0.5);
    EXPECT_TRUE(args.at("none").is_null());
}

TEST(CodecParse, InvalidJsonIsParseError) {
    EXPECT_EQ(parse_error_code("{invalid json"), error::ParseError);
    EXPECT_EQ(parse_error_code(R"({"jsonrpc":"2.0","id":1,"method":"ping"} trailing)"), error::ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_EQ(parse_error_code(R"({"id":1,"method":"ping"})"), error::InvalidRequest);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_EQ(parse_error_code(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), error::InvalidRequest);
}

TEST(CodecParse, MissingMethod) {
    EXPECT_EQ(parse_error_code(R"({"jsonrpc":"2.0","id":1})"), error::InvalidRequest);
    EXPECT_EQ(parse_error_code(R"({"jsonrpc":"2.0","id":1,"method":42})"), error::InvalidRequest);
}

TEST(CodecParse, BadIdType) {
    EXPECT_EQ(parse_error_code(R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})"), error::InvalidRequest);
    EXPECT_EQ(parse_error_code(R"({"jsonrpc":"2.0","id":true,"method":"ping"})"), error::InvalidRequest);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_EQ(parse_error_code("[1,2,3]"), error::InvalidRequest);
    EXPECT_EQ(parse_error_code("42"), error::InvalidRequest);
}

// ---- Build and serialize ----

TEST(CodecSerialize, Response) {
    auto resp = Codec::create_response(RequestId{int64_t{3}}, nlohmann::json{{"ok", true}});
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 3);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseWithData) {
    auto resp = Codec::create_error_response(
        RequestId{std::string("req-1")},
        Codec::create_error(error::InvalidParams, "query is required",
                            nlohmann::json{{"suggestion", "Check the tool input schema and try again"}}));
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "req-1");
    EXPECT_EQ(j["error"]["code"], -32602);
    EXPECT_EQ(j["error"]["message"], "query is required");
    EXPECT_EQ(j["error"]["data"]["suggestion"], "Check the tool input schema and try again");
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecSerialize, ErrorResponseWithoutIdUsesSentinel) {
    auto resp = Codec::create_error_response(std::nullopt,
                                             Codec::create_error(error::InvalidRequest, "bad"));
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], 0);
    EXPECT_FALSE(j["error"].contains("data"));
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    auto resp = Codec::create_response(RequestId{int64_t{4}},
                                       nlohmann::json{{"text", std::string("caf\xff")}});
    std::string line;
    ASSERT_NO_THROW(line = Codec::serialize(resp));
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["id"], 4);
    EXPECT_EQ(j["result"]["text"], "caf\xEF\xBF\xBD");
}
