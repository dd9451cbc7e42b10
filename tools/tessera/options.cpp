/**
 * Command line parsing for the tessera tool
 */

#include "options.hpp"
#include <charconv>
#include <fmt/format.h>

namespace tessera::cli {

namespace {

std::optional<u32> parse_count(std::string_view text) {
    u32 value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// "16,24,32"
std::optional<std::vector<u32>> parse_sizes(std::string_view text) {
    std::vector<u32> sizes;
    while (true) {
        usize comma = text.find(',');
        auto size = parse_count(text.substr(0, comma));
        if (!size) {
            return std::nullopt;
        }
        sizes.push_back(*size);
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return sizes;
}

} // anonymous namespace

Result<Options, std::string> parse_arguments(const std::vector<std::string>& args) {
    Options options;
    bool have_input = false;

    for (usize i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
            continue;
        }

        if (arg.starts_with("-")) {
            if (i + 1 >= args.size()) {
                return make_error(fmt::format("{} needs a value", arg));
            }
            const std::string& value = args[++i];

            auto count = [&](u32& out) -> bool {
                auto parsed = parse_count(value);
                if (!parsed) return false;
                out = *parsed;
                return true;
            };

            bool ok = true;
            if (arg == "--columns" || arg == "-c") {
                ok = count(options.config.columns);
            } else if (arg == "--supersample" || arg == "-s") {
                ok = count(options.config.supersample);
            } else if (arg == "--threads" || arg == "-t") {
                ok = count(options.config.worker_threads);
            } else if (arg == "--jobs" || arg == "-j") {
                ok = count(options.config.parallel_jobs);
            } else if (arg == "--rows" || arg == "-r") {
                u32 rows = 0;
                ok = count(rows);
                options.config.fixed_rows = rows;
            } else if (arg == "--sizes") {
                auto sizes = parse_sizes(value);
                ok = sizes.has_value();
                if (sizes) options.config.icon_sizes = std::move(*sizes);
            } else if (arg == "--output" || arg == "-o") {
                options.config.output_root = value;
            } else if (arg == "--log-file") {
                options.log_file = std::filesystem::path(value);
            } else {
                return make_error(fmt::format("unknown option {}", arg));
            }

            if (!ok) {
                return make_error(fmt::format("invalid value \"{}\" for {}", value, arg));
            }
            continue;
        }

        if (have_input) {
            return make_error(fmt::format("unexpected argument {}", arg));
        }
        options.input_root = arg;
        have_input = true;
    }

    if (options.show_help) {
        return options;
    }
    if (!have_input) {
        return make_error(std::string("no input directory given"));
    }
    if (options.verbose && options.quiet) {
        return make_error(std::string("--verbose and --quiet are mutually exclusive"));
    }
    return options;
}

std::string usage(std::string_view program) {
    return fmt::format(
        "Usage: {} [options] <input-dir>\n"
        "\n"
        "Packs every category of SVG icons under <input-dir> into one texture\n"
        "atlas and one index per icon size.\n"
        "\n"
        "Options:\n"
        "  -c, --columns N       icons per atlas row (default 20)\n"
        "      --sizes A,B,...   icon sizes in pixels (default 16,24,32,64)\n"
        "  -s, --supersample N   render at N times the icon size (default 4)\n"
        "  -o, --output DIR      output root (default atlases)\n"
        "  -r, --rows N          fixed number of rows; larger sets are truncated\n"
        "  -t, --threads N       render threads per job, 0 = all cores (default 0)\n"
        "  -j, --jobs N          jobs run at the same time (default 1)\n"
        "  -v, --verbose         debug logging\n"
        "  -q, --quiet           warnings and errors only\n"
        "      --log-file PATH   also append the log to PATH\n"
        "  -h, --help            show this help\n",
        program);
}

} // namespace tessera::cli
