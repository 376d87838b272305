#ifndef TRIAGEGUARD_SUBSTITUTION_SCHEMA_FILTER_HPP
#define TRIAGEGUARD_SUBSTITUTION_SCHEMA_FILTER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../core/errors.hpp"

namespace triageguard {
namespace substitution {

using json = nlohmann::json;

/**
 * @brief Drop every argument key the tool's input schema does not declare.
 *
 * Keeps session-tracking fields and other internal keys out of external calls.
 * Rules:
 *   - object schema with "properties": keep declared keys only, recurse into
 *     each kept value with its property schema;
 *   - "additionalProperties": true keeps undeclared keys unchanged;
 *   - array schema with "items": recurse into every element;
 *   - anything else passes through untouched.
 * Dropped key paths are appended to `dropped` (e.g. "options._session").
 *
 * @throw core::ToolSchemaError if a "required" key is missing or the value is
 *        not an object where the schema demands one.
 */
inline json FilterBySchema(const json &value, const json &schema,
                           std::vector<std::string> &dropped, const std::string &path = "")
{
    if (!schema.is_object()) {
        return value;
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        if (!value.is_object()) {
            throw core::ToolSchemaError("expected an object at '" + (path.empty() ? "$" : path) + "'");
        }
        const json &props = schema["properties"];
        const bool keepExtra = schema.contains("additionalProperties")
                               && schema["additionalProperties"].is_boolean()
                               && schema["additionalProperties"].get<bool>();

        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto &req : schema["required"]) {
                if (req.is_string() && !value.contains(req.get<std::string>())) {
                    throw core::ToolSchemaError("missing required argument '"
                                                + (path.empty() ? "" : path + ".") + req.get<std::string>() + "'");
                }
            }
        }

        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string childPath = path.empty() ? it.key() : path + "." + it.key();
            if (props.contains(it.key())) {
                out[it.key()] = FilterBySchema(it.value(), props[it.key()], dropped, childPath);
            } else if (keepExtra) {
                out[it.key()] = it.value();
            } else {
                dropped.push_back(childPath);
            }
        }
        return out;
    }

    if (schema.contains("items") && value.is_array()) {
        json out = json::array();
        size_t index = 0;
        for (const auto &element : value) {
            out.push_back(FilterBySchema(element, schema["items"], dropped,
                                         path + "[" + std::to_string(index++) + "]"));
        }
        return out;
    }

    return value;
}

} // namespace substitution
} // namespace triageguard

#endif // TRIAGEGUARD_SUBSTITUTION_SCHEMA_FILTER_HPP
