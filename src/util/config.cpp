#include <ope/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace ope {

static OpeError config_error(std::string msg) {
    return OpeError{OpeError::Config, std::move(msg)};
}

static Result<char> single_char(const toml::table& tbl, const char* key, char fallback) {
    auto node = tbl[key];
    if (!node) return Result<char>::ok(fallback);
    auto s = node.value<std::string>();
    if (!s || s->size() != 1) {
        return OpeError{OpeError::Config,
            std::string("matcher.") + key + " must be a single character",
            "e.g. " + std::string(key) + " = \"<\""};
    }
    return Result<char>::ok((*s)[0]);
}

Result<MatcherConfig> MatcherConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return config_error(std::string("config TOML parse error: ") + e.what());
    }

    MatcherConfig cfg;

    // [matcher] section
    if (auto matcher = doc["matcher"].as_table()) {
        if (auto node = (*matcher)["cache-size"]) {
            auto v = node.value<int64_t>();
            if (!v || *v <= 0) {
                return OpeError{OpeError::Config,
                    "matcher.cache-size must be a positive integer",
                    "the compiled-pattern cache holds at least one entry"};
            }
            cfg.cache_size = static_cast<size_t>(*v);
            cfg.cache_size_set = true;
        }

        auto start = single_char(*matcher, "delimiter-start", cfg.delimiters.start);
        OPE_TRY(start);
        auto end = single_char(*matcher, "delimiter-end", cfg.delimiters.end);
        OPE_TRY(end);
        if (start.value() == end.value()) {
            return config_error("matcher.delimiter-start and matcher.delimiter-end must differ");
        }
        if ((*matcher)["delimiter-start"] || (*matcher)["delimiter-end"]) {
            cfg.delimiters = Delimiters{start.value(), end.value()};
            cfg.delimiters_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            if (!s || !log::parse_level(*s, cfg.log_level)) {
                return OpeError{OpeError::Config,
                    "unknown log level in log.level",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto node = (*lg)["color"]) {
            auto b = node.value<bool>();
            if (!b) return config_error("log.color must be true or false");
            cfg.log_color = *b;
        }
    }

    return Result<MatcherConfig>::ok(std::move(cfg));
}

Result<MatcherConfig> MatcherConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return OpeError{OpeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return MatcherConfig::parse(ss.str());
}

void MatcherConfig::merge(const MatcherConfig& other) {
    if (other.cache_size_set) {
        cache_size = other.cache_size;
        cache_size_set = true;
    }
    if (other.delimiters_set) {
        delimiters = other.delimiters;
        delimiters_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color.has_value()) {
        log_color = other.log_color;
    }
}

MatcherConfig MatcherConfig::effective(const std::optional<MatcherConfig>& global,
                                       const std::optional<MatcherConfig>& local) {
    MatcherConfig result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void MatcherConfig::apply_logging() const {
    log::set_level(log_level);
    if (log_color.has_value()) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ope/config.toml";
}

} // namespace ope
