#include <git_summarizer/mcp/git_tools.hpp>

#include <git_summarizer/core/log.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace git_summarizer {

namespace {

constexpr const char* kLogComponent = "mcp";

constexpr const char* kStagedDiffIntro =
    "获取当前 git 暂存区的变更内容 (git diff --staged)。"
    "获取后，请你根据变更内容总结出一个提交信息，并询问用户是否提交。\n\n"
    "### 提交格式要求：\n";

constexpr const char* kStagedDiffConstraints =
    "\n\n### 额外约束：\n"
    "- Body 的每一行不得超过 80 个字符。\n"
    "- 如果修改范围很小，可以同时省略 English body 和 Chinese body。\n"
    "- 如果不省略 body，则必须同时保留 English body 和 Chinese body，不得只写其中一个。";

constexpr const char* kExecuteCommitDescription =
    "执行提交。请在用户确认了你总结的提交信息后再调用此工具。";

ToolResult FromBackend(const std::string& tool,
                       const Result<std::string, Error>& result) {
    if (result.IsErr()) {
        LogWarn(kLogComponent, tool + " failed: " + result.Error().ToString());
        return TextResult(result.Error().message, true);
    }
    return TextResult(result.Value());
}

// get_staged_diff takes no arguments.
ToolResult HandleGetStagedDiff(IGitBackend& backend) {
    return FromBackend(kGetStagedDiffTool, backend.GetStagedDiff());
}

// execute_commit: a missing or non-string message is committed as "".
ToolResult HandleExecuteCommit(IGitBackend& backend,
                               const nlohmann::json& arguments) {
    std::string message;
    if (arguments.is_object()) {
        auto it = arguments.find("message");
        if (it != arguments.end() && it->is_string()) {
            message = it->get<std::string>();
        }
    }
    return FromBackend(kExecuteCommitTool, backend.Commit(message));
}

} // anonymous namespace

std::string StagedDiffDescription(const std::string& commit_format) {
    return std::string(kStagedDiffIntro) + commit_format + kStagedDiffConstraints;
}

void RegisterGitTools(ToolRegistry& registry, IGitBackend& backend,
                      const ServerConfig& config) {
    registry.Register(
        kGetStagedDiffTool,
        DescriptionProvider([&config] {
            return StagedDiffDescription(config.Get().commit_format);
        }),
        {{"type", "object"}, {"properties", nlohmann::json::object()}},
        [&backend](const nlohmann::json&) {
            return HandleGetStagedDiff(backend);
        });

    registry.Register(
        kExecuteCommitTool,
        std::string(kExecuteCommitDescription),
        {{"type", "object"},
         {"properties",
          {{"message", {{"type", "string"}, {"description", "提交信息"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [&backend](const nlohmann::json& arguments) {
            return HandleExecuteCommit(backend, arguments);
        });
}

} // namespace git_summarizer
