#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

// Minimal JSON-schema checker for tool arguments and structured model output.
// Covers type, properties, required, enum, minLength/maxLength and items.

inline bool schema_type_matches(const std::string& type, const nlohmann::json& v) {
    if (type == "object")  return v.is_object();
    if (type == "array")   return v.is_array();
    if (type == "string")  return v.is_string();
    if (type == "integer") return v.is_number_integer();
    if (type == "number")  return v.is_number();
    if (type == "boolean") return v.is_boolean();
    if (type == "null")    return v.is_null();
    return true;
}

inline std::string schema_type_label(const nlohmann::json& type) {
    if (type.is_string()) return type.get<std::string>();
    std::string out;
    for (auto& t : type) {
        if (!out.empty()) out += " or ";
        out += t.get<std::string>();
    }
    return out;
}

inline void validate_schema_at(const nlohmann::json& schema, const nlohmann::json& value,
                               const std::string& path, std::vector<std::string>& errors) {
    if (!schema.is_object()) return;
    std::string where = path.empty() ? "value" : path;

    if (schema.contains("type")) {
        auto& type = schema["type"];
        bool ok = false;
        if (type.is_string()) {
            ok = schema_type_matches(type.get<std::string>(), value);
        } else if (type.is_array()) {
            for (auto& t : type) {
                if (t.is_string() && schema_type_matches(t.get<std::string>(), value)) { ok = true; break; }
            }
        } else {
            ok = true;
        }
        if (!ok) {
            errors.push_back(where + ": expected " + schema_type_label(type));
            return;
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (auto& e : schema["enum"]) {
            if (e == value) { found = true; break; }
        }
        if (!found) errors.push_back(where + ": value is not one of the allowed options");
    }

    if (value.is_string()) {
        size_t len = value.get<std::string>().size();
        if (schema.contains("minLength") && len < schema["minLength"].get<size_t>()) {
            errors.push_back(where + ": must be at least " +
                             std::to_string(schema["minLength"].get<size_t>()) + " character(s)");
        }
        if (schema.contains("maxLength") && len > schema["maxLength"].get<size_t>()) {
            errors.push_back(where + ": must be at most " +
                             std::to_string(schema["maxLength"].get<size_t>()) + " character(s)");
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (auto& r : schema["required"]) {
                auto key = r.get<std::string>();
                if (!value.contains(key)) {
                    errors.push_back((path.empty() ? key : path + "." + key) + ": field required");
                }
            }
        }
        if (schema.contains("properties") && schema["properties"].is_object()) {
            for (auto& [key, sub] : schema["properties"].items()) {
                if (!value.contains(key)) continue;
                validate_schema_at(sub, value[key], path.empty() ? key : path + "." + key, errors);
            }
        }
    }

    if (value.is_array() && schema.contains("items") && schema["items"].is_object()) {
        for (size_t i = 0; i < value.size(); i++) {
            validate_schema_at(schema["items"], value[i], where + "[" + std::to_string(i) + "]", errors);
        }
    }
}

// Returns one message per violation; empty means the value conforms.
inline std::vector<std::string> validate_schema(const nlohmann::json& schema, const nlohmann::json& value) {
    std::vector<std::string> errors;
    validate_schema_at(schema, value, "", errors);
    return errors;
}

// Tool parameter schemas are always objects at the root.
inline nlohmann::json normalize_parameters_schema(nlohmann::json params) {
    if (!params.is_object()) params = nlohmann::json::object();
    if (!params.contains("type")) params["type"] = "object";
    if (!params.contains("properties")) params["properties"] = nlohmann::json::object();
    return params;
}

} // namespace zenbot
