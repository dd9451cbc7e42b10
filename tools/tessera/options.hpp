#pragma once

#include "tessera/atlas/config.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tessera::cli {

struct Options {
    atlas::PackerConfig config;
    std::filesystem::path input_root;

    bool verbose{false};
    bool quiet{false};
    std::optional<std::filesystem::path> log_file;
    bool show_help{false};
};

// Parse argv[1..]; the error text is meant for the user
[[nodiscard]] Result<Options, std::string> parse_arguments(const std::vector<std::string>& args);

[[nodiscard]] std::string usage(std::string_view program);

} // namespace tessera::cli
