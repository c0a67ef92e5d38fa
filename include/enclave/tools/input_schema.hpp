/**
 * @file input_schema.hpp
 * @brief Typed argument schema of a tool
 *
 * A small JSON-schema subset: an object with typed properties (string,
 * integer, number, boolean), required flags, defaults and numeric bounds.
 *
 * **Usage Example**:
 * @code
 * InputSchema schema;
 * schema.Required("query", PropertyType::STRING, "Search query")
 *       .Optional("num_results", PropertyType::INTEGER, "Result count", 5)
 *       .Range("num_results", 1, 10);
 *
 * json args = schema.Validate(json::parse(R"({"query": "enclave"})"));
 * // args["num_results"] == 5
 * @endcode
 *
 * @date 2026
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace enclave {
namespace tools {

enum class PropertyType {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN
};

const char* ToString(PropertyType type);

/**
 * @struct PropertySpec
 * @brief One named argument
 */
struct PropertySpec {
    std::string name;
    PropertyType type{PropertyType::STRING};
    std::string description;
    bool required{false};
    std::optional<nlohmann::json> default_value;
    std::optional<double> minimum;
    std::optional<double> maximum;
};

class InputSchema {
public:
    InputSchema& Required(const std::string& name, PropertyType type, const std::string& description);

    InputSchema& Optional(const std::string& name, PropertyType type, const std::string& description,
                          std::optional<nlohmann::json> default_value = std::nullopt);

    /**
     * @brief Inclusive numeric bounds for an existing property
     * @throws std::invalid_argument if the property is unknown
     */
    InputSchema& Range(const std::string& name, double minimum, double maximum);

    /**
     * @brief Check arguments and fill in defaults
     *
     * null is accepted as an empty object. Unknown keys are ignored.
     *
     * @return Arguments with defaults applied
     * @throws SandboxError(INVALID_ARGUMENTS) on a missing required
     *         property, a type mismatch or a value out of range
     */
    nlohmann::json Validate(const nlohmann::json& arguments) const;

    /**
     * @brief JSON-schema rendering for the agent
     */
    nlohmann::json ToJson() const;

    const std::vector<PropertySpec>& Properties() const { return properties_; }

private:
    PropertySpec* FindProperty(const std::string& name);

    std::vector<PropertySpec> properties_;
};

} // namespace tools
} // namespace enclave
