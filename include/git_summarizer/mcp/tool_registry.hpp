#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace git_summarizer {

// Content text of the result for a tools/call naming an unregistered tool.
extern const char* const kUnknownToolMessage;

// ---------------------------------------------------------------------------
// ToolSchema — one entry of a tools/list response.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
};

// Single text content block.
ToolResult TextResult(const std::string& text, bool is_error = false);

// {"content": [...]} plus "isError": true for failures only.
nlohmann::json ToolResultToJson(const ToolResult& result);

// A tool handler takes the tools/call arguments (null when absent).
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// Produces a tool description at listing time.
using DescriptionProvider = std::function<std::string()>;

// ---------------------------------------------------------------------------
// ToolRegistry — registry of MCP tools.
//
// Descriptions are providers, evaluated on every Tools() call, so a tool can
// reflect settings changed after registration. Tools() lists in
// registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  DescriptionProvider description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] std::vector<ToolSchema> Tools() const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    struct Entry {
        std::string name;
        DescriptionProvider description;
        nlohmann::json input_schema;
    };

    std::vector<Entry> entries_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace git_summarizer
