#pragma once

#include <ope/delimiter.hpp>
#include <ope/log.hpp>
#include <ope/result.hpp>
#include <optional>
#include <string>

namespace ope {

// Matcher settings, read from TOML:
//
//   [matcher]
//   cache-size = 1024
//   delimiter-start = "<"
//   delimiter-end = ">"
//
//   [log]
//   level = "info"
//   color = false          # default: on when stderr is a terminal
struct MatcherConfig {
    size_t cache_size = 1024;
    Delimiters delimiters;
    log::Level log_level = log::Info;
    std::optional<bool> log_color;

    // Track which fields were explicitly set (for merge)
    bool cache_size_set = false;
    bool delimiters_set = false;
    bool log_level_set = false;

    static Result<MatcherConfig> load(const std::string& path);
    static Result<MatcherConfig> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const MatcherConfig& other);

    // global -> local
    static MatcherConfig effective(const std::optional<MatcherConfig>& global,
                                   const std::optional<MatcherConfig>& local);

    // Push log level and colour into the global logger.
    void apply_logging() const;
};

// ~/.ope/config.toml, or "" when no home directory is known.
std::string global_config_path();

} // namespace ope
