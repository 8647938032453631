// File: src/support/path_utils.hpp
// Purpose: Declare helpers for normalizing and joining markdown file paths.
// Key invariants: Normalized paths always use forward slashes and have dot
// segments resolved; an empty input normalizes to ".".
// Ownership/Lifetime: Free functions returning owned strings.
// Links: docs/codemap.md
#pragma once

#include <string>
#include <string_view>

namespace folio::support
{

/// @brief Normalize @p path lexically.
/// @param path Arbitrary file system path, possibly using backslashes.
/// @return Normalized path with dot segments collapsed and forward slashes.
[[nodiscard]] std::string normalizePath(std::string_view path);

/// @brief Directory component of @p path, "." when @p path has none.
[[nodiscard]] std::string dirname(std::string_view path);

/// @brief Resolve @p relative against the directory containing @p from.
/// @details Link targets are relative to the referencing file, never to the
///          working directory; `resolveSibling("doc/b.md", "./a.md")` yields
///          "doc/a.md".  Absolute @p relative paths are returned normalized.
/// @param from Path of the referencing file.
/// @param relative Path written in the link.
/// @return Normalized joined path.
[[nodiscard]] std::string resolveSibling(std::string_view from, std::string_view relative);

/// @brief Compute basename component of @p path after normalization.
/// @param path Path expressed with forward slashes.
/// @return Last path component or empty string when none exists.
[[nodiscard]] std::string basename(std::string_view path);

} // namespace folio::support
