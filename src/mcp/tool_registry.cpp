#include <git_summarizer/mcp/tool_registry.hpp>

#include <git_summarizer/core/log.hpp>

#include <exception>
#include <utility>

namespace git_summarizer {

const char* const kUnknownToolMessage = "未知工具";

ToolResult TextResult(const std::string& text, bool is_error) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

nlohmann::json ToolResultToJson(const ToolResult& result) {
    nlohmann::json j;
    j["content"] = result.content;
    if (result.is_error) {
        j["isError"] = true;
    }
    return j;
}

void ToolRegistry::Register(const std::string& name,
                            DescriptionProvider description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) == 0) {
        entries_.push_back({name, std::move(description), input_schema});
    } else {
        // Re-registration replaces the tool in place; names stay unique.
        for (auto& entry : entries_) {
            if (entry.name == name) {
                entry.description = std::move(description);
                entry.input_schema = input_schema;
            }
        }
    }
    handlers_[name] = std::move(handler);
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    Register(name, DescriptionProvider([description] { return description; }),
             input_schema, std::move(handler));
}

std::vector<ToolSchema> ToolRegistry::Tools() const {
    std::vector<ToolSchema> schemas;
    schemas.reserve(entries_.size());
    for (const auto& entry : entries_) {
        schemas.push_back({entry.name, entry.description(), entry.input_schema});
    }
    return schemas;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        LogWarn("mcp", "tools/call for unknown tool '" + name + "'");
        return TextResult(kUnknownToolMessage, true);
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "tool '" + name + "' threw: " + e.what());
        return TextResult(std::string("Tool error: ") + e.what(), true);
    }
}

} // namespace git_summarizer
