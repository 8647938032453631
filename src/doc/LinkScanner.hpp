//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/LinkScanner.hpp
// Purpose: Extracts cross-file `](./path.md#label)` and same-file `](#label)`
//          links from markdown lines.
// Key invariants: Offsets delimit the parenthesised target, '(' and ')'
//                 included, so the merger can splice replacements in place.
// Ownership/Lifetime: Links own copies of their target and label.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::doc
{

/// @brief Flavour of an extracted link.
enum class LinkKind
{
    CrossFile, ///< `](./path.md#label)`: section of another file.
    Local      ///< `](#label)`: section of the file containing the link.
};

/// @brief One link found on a line.
struct Link
{
    LinkKind kind = LinkKind::CrossFile;
    /// Target path as written, "./" prefix included; empty for local links.
    std::string target;
    /// Section label; std::nullopt for a link to a whole file.
    std::optional<std::string> label;
    uint32_t line = 0;   ///< 1-based line number.
    uint32_t column = 0; ///< 1-based column of the opening '('.
    size_t begin = 0;    ///< Offset of '(' within the line.
    size_t end = 0;      ///< Offset one past ')' within the line.
};

/// @brief True when @p path ends in ".md" or ".markdown".
[[nodiscard]] bool hasMarkdownSuffix(std::string_view path);

/// @brief Extract the links of a single line.
/// @param line Line text without newline.
/// @param lineNo 1-based line number stored in each link.
/// @return Links in left-to-right order, or an error when a cross-file link
///         target contains more than one '#'.
support::Expected<std::vector<Link>> scanLine(std::string_view line, uint32_t lineNo);

/// @brief Extract the links of every line, numbering lines from 1.
support::Expected<std::vector<Link>> scanLinks(const std::vector<std::string> &lines);

} // namespace folio::doc
