/**
 * Category slugs
 */

#include "tessera/catalog/slug.hpp"

namespace tessera::catalog {

std::string slugify(std::string_view name) {
    std::string slug;
    slug.reserve(name.size());
    bool pending_separator = false;

    for (char raw : name) {
        char c = raw;
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }

        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            if (pending_separator && !slug.empty()) {
                slug += '_';
            }
            pending_separator = false;
            slug += c;
        } else {
            pending_separator = true;
        }
    }

    if (slug.empty()) {
        return "icons";
    }
    return slug;
}

} // namespace tessera::catalog
