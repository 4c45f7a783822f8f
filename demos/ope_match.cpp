// ope_match.cpp
//
// Command-line front end for the template matcher. Tests a needle against a
// list of templates and prints whether any of them matched:
//
//     ./ope_match create "<create|delete>"              # match
//     ./ope_match user/42 "user/<[0-9]+>" "admin/<.*>"  # match
//     ./ope_match --config ope.toml "a{b}" "a{b|c}"     # custom delimiters
//
// Exit status: 0 on match, 1 on no match, 2 on error.

#include <ope/config.hpp>
#include <ope/log.hpp>
#include <ope/matcher.hpp>
#include <ope/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace ope;

struct Args {
    std::optional<std::string> config_path;
    std::string needle;
    std::vector<std::string> haystack;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argc) {
                return OpeError{OpeError::InvalidArg,
                    "--config needs a file argument",
                    "usage: ope_match [--config FILE] NEEDLE TEMPLATE..."};
            }
            args.config_path = argv[++i];
        } else {
            positional.push_back(std::move(a));
        }
    }

    if (positional.size() < 2) {
        return OpeError{OpeError::InvalidArg,
            "need a needle and at least one template",
            "usage: ope_match [--config FILE] NEEDLE TEMPLATE..."};
    }

    args.needle = positional.front();
    args.haystack.assign(positional.begin() + 1, positional.end());
    return Result<Args>::ok(std::move(args));
}

// Global config (if present) overlaid with --config.
Result<MatcherConfig> load_config(const Args& args) {
    std::optional<MatcherConfig> global;
    std::optional<MatcherConfig> local;

    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto g = MatcherConfig::load(global_path);
        OPE_TRY(g);
        global = std::move(g).value();
    }

    if (args.config_path) {
        auto l = MatcherConfig::load(*args.config_path);
        OPE_TRY(l);
        local = std::move(l).value();
    }

    return Result<MatcherConfig>::ok(MatcherConfig::effective(global, local));
}

Result<bool> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    OPE_TRY(args);

    auto cfg = load_config(args.value());
    OPE_TRY(cfg);
    cfg.value().apply_logging();

    log::debug("cache size %zu, delimiters '%c' '%c'", cfg.value().cache_size,
               cfg.value().delimiters.start, cfg.value().delimiters.end);

    auto matcher = RegexMatcher::from_config(cfg.value());
    OPE_TRY(matcher);

    return matcher.value()->matches(cfg.value().delimiters,
                                    args.value().haystack, args.value().needle);
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);

    if (result.is_err()) {
        log::error("ope_match failed");
        std::cerr << result.error().format() << "\n";
        return 2;
    }

    std::cout << (result.value() ? "match" : "no match") << "\n";
    return result.value() ? 0 : 1;
}
