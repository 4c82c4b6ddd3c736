#pragma once

#include <git_summarizer/core/log.hpp>

#include <optional>
#include <string>

namespace git_summarizer {

// Startup configuration, merged from the YAML file and the command line.
// Unset optionals mean "not given by this source".
struct AppConfig {
    std::optional<std::string> config_path;   // CLI only
    std::optional<std::string> repository;    // defaults to "."
    std::optional<std::string> commit_format;
    std::optional<std::string> commit_format_file;

    std::optional<LogLevel> log_level;        // defaults to Warn
    bool log_json = false;
    std::optional<std::string> log_file;
    bool force_color = false;
    bool force_no_color = false;

    bool show_help = false;                   // CLI only
    bool show_version = false;                // CLI only
};

} // namespace git_summarizer
