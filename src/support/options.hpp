//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings record shared by the merge pipeline and CLI.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace folio::support
{

/// @brief Holds the command-line settings that influence a merge run.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Destination of the merged document.
    std::string output;

    /// @brief Markdown inputs in document order.
    std::vector<std::string> inputs;

    /// @brief Directory searched when mapping a file identity back to a path.
    std::string identityRoot = ".";

    /// @brief Marker written after every input file.
    std::string pageBreak = "\\newpage";

    /// @brief Validate and rewrite same-file `(#label)` links as well.
    bool localLinks = false;

    /// @brief Echo every line changed by the rewrite pass.
    bool trace = false;

    /// @brief Highlight diagnostic severities with ANSI escapes.
    bool color = false;

    /// @brief Suppress the banner, the label context dump and the summary.
    bool quiet = false;
};
} // namespace folio::support
