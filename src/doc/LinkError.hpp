//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/LinkError.hpp
// Purpose: Declares the link validation failures and their grouped report.
// Key invariants: A report never lists a source file without errors.
// Ownership/Lifetime: Value types.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace folio::support
{
class SourceManager;
}

namespace folio::doc
{

/// @brief Why a link cannot be merged.
enum class LinkErrorKind
{
    LabelClash,    ///< Target file defines the label more than once.
    DeadLabelLink, ///< Target file is known but lacks the label.
    DeadFileLink,  ///< Target file is not one of the inputs.
    DirectLink     ///< Link names a file without a section.
};

/// @brief A single failed link.
struct LinkError
{
    LinkErrorKind kind;
    std::string targetFile;  ///< Target path resolved against the source directory.
    std::string label;       ///< Empty for DirectLink.
    support::SourceLoc loc;  ///< Position of the link in its source file.
};

/// @brief Errors found in one source file.
struct FileLinkErrors
{
    std::string sourceFile;
    std::vector<LinkError> errors;
};

/// @brief Errors of every failing source file, in input order.
using LinkReport = std::vector<FileLinkErrors>;

/// @brief Short kebab-case tag naming @p kind ("dead-label-link", ...).
const char *linkErrorKindName(LinkErrorKind kind);

/// @brief Human-readable sentence for @p error, tag included.
std::string describe(const LinkError &error);

/// @brief Total number of errors in @p report.
size_t errorCount(const LinkReport &report);

/// @brief Print @p report grouped by source file.
///
/// Every group starts with "on file <path>" and lists one compiler-style
/// diagnostic per error.
void printLinkReport(const LinkReport &report,
                     std::ostream &os,
                     const support::SourceManager &sm,
                     bool color = false);

} // namespace folio::doc
