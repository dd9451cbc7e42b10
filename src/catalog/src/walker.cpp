/**
 * Category walker
 */

#include "tessera/catalog/walker.hpp"
#include "tessera/catalog/slug.hpp"
#include "tessera/core/logger.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <system_error>

namespace tessera::catalog {

namespace fs = std::filesystem;

namespace {

Logger& logger() {
    return logging::get("catalog");
}

bool is_hidden(const fs::path& path) {
    std::string name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

// Name of the root directory itself, also for "icons/" and "."
std::string root_category_name(const fs::path& root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        absolute = root;
    }
    absolute = absolute.lexically_normal();
    if (absolute.filename().empty()) {
        absolute = absolute.parent_path();
    }
    std::string name = absolute.filename().string();
    return name.empty() ? std::string("icons") : name;
}

// Non-recursive list of the .svg files in `directory`
PackResult<std::vector<atlas::IconSource>> list_sources(const fs::path& directory) {
    std::vector<atlas::IconSource> sources;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return make_error(PackError::read_error(
            fmt::format("cannot list {}: {}", directory.string(), ec.message())));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || type_ec) {
            continue;
        }
        if (is_hidden(entry.path()) || !is_svg_file(entry.path())) {
            continue;
        }
        sources.push_back(atlas::IconSource::from_file(entry.path().stem().string(), entry.path()));
    }
    if (ec) {
        return make_error(PackError::read_error(
            fmt::format("cannot list {}: {}", directory.string(), ec.message())));
    }
    return sources;
}

} // anonymous namespace

bool is_svg_file(const fs::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() != 4 || ext[0] != '.') {
        return false;
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return ext == ".svg";
}

PackResult<Discovery> discover(const fs::path& root, std::optional<usize> capacity) {
    std::error_code ec;
    if (!fs::is_directory(root, ec) || ec) {
        return make_error(PackError::read_error(
            fmt::format("input directory {} does not exist", root.string())));
    }

    // Category name -> directory holding its files
    std::vector<std::pair<std::string, fs::path>> found;

    fs::directory_iterator it(root, ec);
    if (ec) {
        return make_error(PackError::read_error(
            fmt::format("cannot list {}: {}", root.string(), ec.message())));
    }

    bool root_has_icons = false;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        if (is_hidden(entry.path())) {
            continue;
        }
        std::error_code type_ec;
        if (entry.is_directory(type_ec) && !type_ec) {
            found.emplace_back(entry.path().filename().string(), entry.path());
        } else if (entry.is_regular_file(type_ec) && !type_ec && is_svg_file(entry.path())) {
            root_has_icons = true;
        }
    }
    if (ec) {
        return make_error(PackError::read_error(
            fmt::format("cannot list {}: {}", root.string(), ec.message())));
    }
    if (root_has_icons) {
        found.emplace_back(root_category_name(root), root);
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    Discovery discovery;
    std::map<std::string, std::string> slugs;   // slug -> category that owns it

    for (auto& [name, directory] : found) {
        auto sources = list_sources(directory);
        if (sources.is_err()) {
            logger().error_fmt("{}: {}", name, sources.error().message);
            discovery.rejected.push_back(std::move(sources).error());
            continue;
        }

        auto icons = atlas::IconSet::create(std::move(sources).value());
        if (icons.is_err()) {
            PackError error = PackError::invalid_config(
                fmt::format("{}: {}", name, icons.error().message));
            logger().error(error.message);
            discovery.rejected.push_back(std::move(error));
            continue;
        }

        std::string slug = slugify(name);
        auto [owner, inserted] = slugs.emplace(slug, name);
        if (!inserted) {
            PackError error = PackError::invalid_config(fmt::format(
                "{}: output directory \"{}\" is already used by {}", name, slug, owner->second));
            logger().error(error.message);
            discovery.rejected.push_back(std::move(error));
            continue;
        }

        atlas::IconSet set = std::move(icons).value();
        if (capacity && set.size() > *capacity) {
            logger().warn_fmt("{}: {} icons exceed the sheet capacity of {}; dropping the last {}",
                              name, set.size(), *capacity, set.size() - *capacity);
            set = set.truncated(*capacity);
        }

        logger().debug_fmt("{}: {} icon(s) from {}", name, set.size(), directory.string());
        discovery.categories.push_back(atlas::Category{name, std::move(slug), std::move(set)});
    }

    return discovery;
}

} // namespace tessera::catalog
