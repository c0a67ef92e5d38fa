/**
 * @file input_schema.cpp
 * @brief Tool argument validation
 *
 * @date 2026
 */

#include "enclave/tools/input_schema.hpp"
#include "enclave/core/errors.hpp"

#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace enclave {
namespace tools {

using core::ErrorKind;
using core::SandboxError;

namespace {

bool MatchesType(const json& value, PropertyType type) {
    switch (type) {
        case PropertyType::STRING:
            return value.is_string();
        case PropertyType::INTEGER:
            if (value.is_number_integer()) {
                return true;
            }
            // 5.0 is an acceptable integer
            return value.is_number_float() && std::floor(value.get<double>()) == value.get<double>();
        case PropertyType::NUMBER:
            return value.is_number();
        case PropertyType::BOOLEAN:
            return value.is_boolean();
    }
    return false;
}

} // anonymous namespace

const char* ToString(PropertyType type) {
    switch (type) {
        case PropertyType::STRING:  return "string";
        case PropertyType::INTEGER: return "integer";
        case PropertyType::NUMBER:  return "number";
        case PropertyType::BOOLEAN: return "boolean";
    }
    return "unknown";
}

InputSchema& InputSchema::Required(const std::string& name, PropertyType type,
                                   const std::string& description) {
    PropertySpec spec;
    spec.name = name;
    spec.type = type;
    spec.description = description;
    spec.required = true;
    properties_.push_back(std::move(spec));
    return *this;
}

InputSchema& InputSchema::Optional(const std::string& name, PropertyType type,
                                   const std::string& description,
                                   std::optional<json> default_value) {
    PropertySpec spec;
    spec.name = name;
    spec.type = type;
    spec.description = description;
    spec.default_value = std::move(default_value);
    properties_.push_back(std::move(spec));
    return *this;
}

InputSchema& InputSchema::Range(const std::string& name, double minimum, double maximum) {
    PropertySpec* spec = FindProperty(name);
    if (spec == nullptr) {
        throw std::invalid_argument("Range on unknown property: " + name);
    }
    spec->minimum = minimum;
    spec->maximum = maximum;
    return *this;
}

PropertySpec* InputSchema::FindProperty(const std::string& name) {
    for (auto& spec : properties_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

json InputSchema::Validate(const json& arguments) const {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                           std::string("Arguments must be a JSON object, got ") + arguments.type_name());
    }

    json validated = arguments.is_null() ? json::object() : arguments;

    for (const auto& spec : properties_) {
        auto it = validated.find(spec.name);

        if (it == validated.end() || it->is_null()) {
            if (spec.required) {
                throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                                   "Missing required argument '" + spec.name + "'");
            }
            if (spec.default_value.has_value()) {
                validated[spec.name] = *spec.default_value;
            } else if (it != validated.end()) {
                validated.erase(it);
            }
            continue;
        }

        if (!MatchesType(*it, spec.type)) {
            throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                               "Argument '" + spec.name + "' must be " + ToString(spec.type) +
                               ", got " + it->type_name());
        }

        if (spec.type == PropertyType::INTEGER && it->is_number_float()) {
            // 2^63: the first whole double that no longer fits a long long
            constexpr double kIntegerLimit = 9223372036854775808.0;
            double whole = it->get<double>();
            if (whole >= kIntegerLimit || whole < -kIntegerLimit) {
                throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                                   "Argument '" + spec.name + "' is out of the integer range");
            }
            *it = static_cast<long long>(whole);
        }

        if (spec.minimum.has_value() || spec.maximum.has_value()) {
            double value = it->get<double>();
            if ((spec.minimum && value < *spec.minimum) || (spec.maximum && value > *spec.maximum)) {
                throw SandboxError(ErrorKind::INVALID_ARGUMENTS,
                                   "Argument '" + spec.name + "' out of range [" +
                                   std::to_string(spec.minimum.value_or(value)) + ", " +
                                   std::to_string(spec.maximum.value_or(value)) + "]");
            }
        }
    }

    return validated;
}

json InputSchema::ToJson() const {
    json properties = json::object();
    json required = json::array();

    for (const auto& spec : properties_) {
        json property;
        property["type"] = ToString(spec.type);
        property["description"] = spec.description;
        if (spec.default_value.has_value()) {
            property["default"] = *spec.default_value;
        }
        if (spec.minimum.has_value()) {
            property["minimum"] = *spec.minimum;
        }
        if (spec.maximum.has_value()) {
            property["maximum"] = *spec.maximum;
        }
        properties[spec.name] = property;

        if (spec.required) {
            required.push_back(spec.name);
        }
    }

    return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

} // namespace tools
} // namespace enclave
