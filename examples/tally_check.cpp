#include <print>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/cfg/env.h>

#include "tally/tally.hpp"

namespace {

    void usage() {
        std::println(stderr, "usage: tally_check [--preset NAME] TEXT...");
        std::print(stderr, "presets:");
        for (auto name : Tally::presets::preset_names()) std::print(stderr, " {}", name);
        std::println(stderr, "");
    }

} // namespace

int main(int argc, char** argv) {
    // SPDLOG_LEVEL=tally=trace shows why each input was rejected.
    spdlog::cfg::load_env_levels();

    Tally::FormatOptions opts;
    std::vector<std::string_view> inputs;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--preset") {
            if (i + 1 >= argc) {
                usage();
                return 2;
            }
            auto preset = Tally::presets::preset_by_name(argv[++i]);
            if (!preset) {
                std::println(stderr, "unknown preset '{}'", argv[i]);
                usage();
                return 2;
            }
            opts = std::move(*preset);
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.empty()) {
        usage();
        return 2;
    }

    Tally::CurrencyValidator validator{ opts };
    if (!validator.valid()) {
        std::println(stderr, "invalid format: {}", validator.error()->msg);
        return 2;
    }

    bool all_valid = true;
    for (auto text : inputs) {
        bool ok = validator(text);
        all_valid = all_valid && ok;
        std::println("'{}' -> {}", text, ok ? "valid" : "invalid");
    }

    return all_valid ? 0 : 1;
}
