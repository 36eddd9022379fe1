#include "devagent/validation.hpp"
#include <sstream>

namespace devagent {

namespace {

std::string join_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string describe_number(const nlohmann::json& n) {
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_unsigned()) return std::to_string(n.get<uint64_t>());
    std::ostringstream os;
    os << n.get<double>();
    return os.str();
}

std::string type_phrase(const std::string& type) {
    if (type == "object" || type == "array" || type == "integer") return "an " + type;
    return "a " + type;
}

bool matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "string")  return value.is_string();
    if (type == "number")  return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            double d = value.get<double>();
            return d == static_cast<double>(static_cast<int64_t>(d));
        }
        return false;
    }
    if (type == "boolean") return value.is_boolean();
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "null")    return value.is_null();
    // Unknown type keywords are not enforced.
    return true;
}

std::string join_enum(const nlohmann::json& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v.is_string() ? v.get<std::string>() : v.dump();
    }
    return out;
}

ValidationResult validate_value(const nlohmann::json& schema, const nlohmann::json& value,
                                const std::string& path);

ValidationResult validate_object(const nlohmann::json& schema, const nlohmann::json& value,
                                 const std::string& path) {
    if (auto req = schema.find("required"); req != schema.end() && req->is_array()) {
        for (const auto& field : *req) {
            if (!field.is_string()) continue;
            const auto name = field.get<std::string>();
            if (!value.contains(name) || value.at(name).is_null()) {
                return ValidationResult::fail(join_path(path, name) + " is required",
                    nlohmann::json{{"path", join_path(path, name)}, {"reason", "required"}});
            }
        }
    }

    const nlohmann::json* properties = nullptr;
    if (auto props = schema.find("properties"); props != schema.end() && props->is_object()) {
        properties = &*props;
    }

    bool closed = false;
    if (auto extra = schema.find("additionalProperties");
        extra != schema.end() && extra->is_boolean()) {
        closed = !extra->get<bool>();
    }

    for (auto it = value.begin(); it != value.end(); ++it) {
        if (properties && properties->contains(it.key())) {
            // Optional fields sent as null are treated as absent.
            if (it.value().is_null()) continue;
            auto result = validate_value(properties->at(it.key()), it.value(),
                                         join_path(path, it.key()));
            if (!result.valid) return result;
        } else if (closed) {
            return ValidationResult::fail("unexpected property: " + join_path(path, it.key()),
                nlohmann::json{{"path", join_path(path, it.key())}, {"reason", "additionalProperties"}});
        }
    }
    return ValidationResult::ok();
}

ValidationResult validate_value(const nlohmann::json& schema, const nlohmann::json& value,
                                const std::string& path) {
    if (!schema.is_object()) return ValidationResult::ok();
    const std::string field = path.empty() ? "arguments" : path;

    if (auto type = schema.find("type"); type != schema.end() && type->is_string()) {
        const auto t = type->get<std::string>();
        if (!matches_type(t, value)) {
            return ValidationResult::fail(field + " must be " + type_phrase(t),
                nlohmann::json{{"path", field}, {"reason", "type"}, {"expected", t}});
        }
    }

    if (auto values = schema.find("enum"); values != schema.end() && values->is_array()) {
        bool found = false;
        for (const auto& candidate : *values) {
            if (candidate == value) { found = true; break; }
        }
        if (!found) {
            return ValidationResult::fail(field + " must be one of: " + join_enum(*values),
                nlohmann::json{{"path", field}, {"reason", "enum"}, {"allowed", *values}});
        }
    }

    if (value.is_number()) {
        const double v = value.get<double>();
        if (auto min = schema.find("minimum"); min != schema.end() && min->is_number()
            && v < min->get<double>()) {
            return ValidationResult::fail(field + " must be >= " + describe_number(*min),
                nlohmann::json{{"path", field}, {"reason", "minimum"}});
        }
        if (auto max = schema.find("maximum"); max != schema.end() && max->is_number()
            && v > max->get<double>()) {
            return ValidationResult::fail(field + " must be <= " + describe_number(*max),
                nlohmann::json{{"path", field}, {"reason", "maximum"}});
        }
    }

    if (value.is_string()) {
        const auto len = value.get_ref<const std::string&>().size();
        if (auto min = schema.find("minLength"); min != schema.end() && min->is_number_integer()
            && len < min->get<size_t>()) {
            const auto n = min->get<size_t>();
            return ValidationResult::fail(n == 1 ? field + " must not be empty"
                                                 : field + " must be at least " + std::to_string(n) + " characters",
                nlohmann::json{{"path", field}, {"reason", "minLength"}});
        }
        if (auto max = schema.find("maxLength"); max != schema.end() && max->is_number_integer()
            && len > max->get<size_t>()) {
            return ValidationResult::fail(field + " must be at most "
                                          + std::to_string(max->get<size_t>()) + " characters",
                nlohmann::json{{"path", field}, {"reason", "maxLength"}});
        }
    }

    if (value.is_array()) {
        if (auto items = schema.find("items"); items != schema.end() && items->is_object()) {
            for (size_t i = 0; i < value.size(); ++i) {
                auto result = validate_value(*items, value[i], field + "[" + std::to_string(i) + "]");
                if (!result.valid) return result;
            }
        }
    }

    if (value.is_object()) {
        return validate_object(schema, value, path);
    }
    return ValidationResult::ok();
}

} // anonymous namespace

ValidationResult validate_arguments(const nlohmann::json& schema, const nlohmann::json& args) {
    const nlohmann::json& effective = args.is_null() ? nlohmann::json::object() : args;
    if (!effective.is_object()) {
        return ValidationResult::fail("arguments must be an object",
            nlohmann::json{{"path", "arguments"}, {"reason", "type"}, {"expected", "object"}});
    }
    return validate_value(schema, effective, "");
}

} // namespace devagent
