#pragma once

#include <string>
#include <string_view>

namespace tessera::catalog {

/**
 * Output directory name for a category.
 *
 * Lower-cases ASCII letters, replaces every run of characters outside
 * [a-z0-9] with a single '_' and trims leading and trailing '_'. An empty
 * result becomes "icons".
 */
[[nodiscard]] std::string slugify(std::string_view name);

} // namespace tessera::catalog
