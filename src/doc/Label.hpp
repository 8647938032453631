//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/Label.hpp
// Purpose: Heading detection and label normalization for markdown lines.
// Key invariants: normalizeLabel is idempotent; a label never starts or ends
//                 with '-' and never contains "--".
// Ownership/Lifetime: Stateless free functions.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::doc
{

/// @brief True when @p line starts with a '#' (markdown ATX heading).
[[nodiscard]] bool isHeadingLine(std::string_view line);

/// @brief Heading text of @p line: the leading '#' run and the whitespace
///        after it removed.  Returns an empty view for non-heading lines.
[[nodiscard]] std::string_view headingText(std::string_view line);

/// @brief Turn heading text into an anchor label.
///
/// ASCII letters are lowercased.  Runs of whitespace, '/' and '-' become one
/// '-' between kept characters and disappear at either end.  ',', '.' and '`'
/// are deleted without breaking a run.  Every other byte is kept verbatim.
[[nodiscard]] std::string normalizeLabel(std::string_view text);

/// @brief Label defined by @p line, if any.
/// @return std::nullopt for non-heading lines and headings whose text
///         normalizes to the empty string.
[[nodiscard]] std::optional<std::string> headingLabel(std::string_view line);

/// @brief Labels of every heading in @p lines, in file order, duplicates kept.
[[nodiscard]] std::vector<std::string> extractLabels(const std::vector<std::string> &lines);

} // namespace folio::doc
