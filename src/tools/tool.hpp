#ifndef TRIAGEGUARD_TOOLS_TOOL_HPP
#define TRIAGEGUARD_TOOLS_TOOL_HPP

#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

/**
 * @file tool.hpp
 * @brief Contract with tool-integration collaborators (ticket tracker, build
 *        server, knowledge base...). Integrations are opaque request/response
 *        functions: they receive restored, schema-filtered arguments and return
 *        raw results.
 */

namespace triageguard {
namespace tools {

using json = nlohmann::json;

// Tool schema: name plus a JSON-Schema style input contract
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Raw tool execution result
struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text response
    json structured;          // Optional structured JSON data

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json()};
    }

    json ToJson() const {
        json out = {{"content", content}, {"isError", is_error}};
        if (!structured.is_null()) {
            out["structured"] = structured;
        }
        return out;
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

struct RegisteredTool {
    ToolSchema schema;
    ToolHandler handler;
};

class ToolRegistry {
public:
    void Register(ToolSchema schema, ToolHandler handler) {
        if (schema.name.empty() || !handler) {
            throw std::invalid_argument("ToolRegistry: tool needs a name and a handler");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::string name = schema.name;
        tools_[name] = RegisteredTool{std::move(schema), std::move(handler)};
    }

    std::optional<RegisteredTool> Find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RegisteredTool> tools_;
};

} // namespace tools
} // namespace triageguard

#endif // TRIAGEGUARD_TOOLS_TOOL_HPP
