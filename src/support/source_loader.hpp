//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_loader.hpp
// Purpose: Shared helpers for loading markdown inputs as lines.
// Key invariants: Returned lines carry no trailing '\n' or '\r'.
// Ownership/Lifetime: The caller owns the returned buffers.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace folio::support
{

/// @brief Load a file into memory without splitting it.
///
/// @param path Filesystem path to the source file.
/// @return File contents on success; otherwise a diagnostic describing the I/O failure.
Expected<std::string> loadSourceFile(const std::string &path);

/// @brief Load a file and split it into lines.
///
/// A final line without terminating newline is kept; an empty file yields no
/// lines.  Carriage returns preceding a newline are dropped so CRLF documents
/// produce the same labels as LF documents.
///
/// @param path Filesystem path to the source file.
/// @return Lines on success; otherwise a diagnostic describing the I/O failure.
Expected<std::vector<std::string>> loadSourceLines(const std::string &path);

/// @brief Split an in-memory buffer the way loadSourceLines() splits files.
std::vector<std::string> splitLines(const std::string &text);

} // namespace folio::support
