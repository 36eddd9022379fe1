#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace devagent {

struct ValidationResult {
    bool valid = true;
    std::string error;                      // "<field> <reason>"
    std::optional<nlohmann::json> details;

    static ValidationResult ok() { return {}; }
    static ValidationResult fail(std::string error,
                                 std::optional<nlohmann::json> details = std::nullopt) {
        return ValidationResult{false, std::move(error), std::move(details)};
    }
};

/// Validate tool arguments against a tool's declared input schema.
///
/// Supports the JSON-schema subset tool definitions use: type, properties,
/// required, enum, minimum, maximum, minLength, maxLength, items and
/// additionalProperties:false. Null arguments are treated as an empty object.
/// Stops at the first violation.
[[nodiscard]] ValidationResult validate_arguments(const nlohmann::json& schema,
                                                  const nlohmann::json& args);

} // namespace devagent
