// File: src/support/path_utils.cpp
// Purpose: Implement helpers for normalizing and joining markdown file paths.
// Key invariants: Normalization always yields forward slashes and resolves dot
// segments.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/codemap.md

#include "support/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace folio::support
{

std::string normalizePath(std::string_view path)
{
    std::string sanitized(path);
    std::replace(sanitized.begin(), sanitized.end(), '\\', '/');

    if (sanitized.empty())
        return std::string{"."};

    std::filesystem::path fsPath(sanitized);
    std::string generic = fsPath.lexically_normal().generic_string();

    // lexically_normal keeps a trailing separator for directory paths.
    if (generic.size() > 1 && generic.back() == '/')
        generic.pop_back();

    if (generic.empty())
        generic = sanitized.front() == '/' ? std::string{"/"} : std::string{"."};

    return generic;
}

std::string dirname(std::string_view path)
{
    const std::string normalized = normalizePath(path);
    size_t pos = normalized.find_last_of('/');
    if (pos == std::string::npos)
        return std::string{"."};
    if (pos == 0)
        return std::string{"/"};
    return normalized.substr(0, pos);
}

std::string resolveSibling(std::string_view from, std::string_view relative)
{
    std::filesystem::path rel{std::string(relative)};
    if (rel.is_absolute())
        return normalizePath(relative);

    std::filesystem::path joined = std::filesystem::path(dirname(from)) / rel;
    return normalizePath(joined.generic_string());
}

std::string basename(std::string_view path)
{
    if (path.empty())
        return {};
    size_t pos = path.find_last_of('/');
    if (pos == std::string_view::npos)
        return std::string(path);
    if (pos + 1 >= path.size())
        return {};
    return std::string(path.substr(pos + 1));
}

} // namespace folio::support
