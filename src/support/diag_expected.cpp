//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  The utilities defined here wrap structured diagnostics around an
// Expected<void> type, provide consistent severity-to-string mapping, and offer
// helpers for printing diagnostics with optional source location context.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.
/// @details Registry construction, link scanning and the merger all report
///          recoverable failures through `Expected`.  This translation unit
///          gathers the constructors, severity conversions and the printer so
///          every stage of the pipeline reports in one uniform format.

#include "diag_expected.hpp"

namespace folio::support
{
namespace
{
constexpr const char *kAnsiRed = "\033[31m";
constexpr const char *kAnsiYellow = "\033[33m";
constexpr const char *kAnsiReset = "\033[0m";

Diag makeDiag(Severity severity, SourceLoc loc, std::string msg)
{
    return Diag{severity, std::move(msg), loc};
}
} // namespace

/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @details Success is indicated by the absence of a stored diagnostic.
///
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return makeDiag(Severity::Error, loc, std::move(msg));
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return makeDiag(Severity::Warning, loc, std::move(msg));
}

Diag makeNote(SourceLoc loc, std::string msg)
{
    return makeDiag(Severity::Note, loc, std::move(msg));
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a valid location is available and @p sm knows the file, the
///          message is prefixed with "<path>:<line>:<column>:" following the
///          common compiler diagnostic style.  Errors are highlighted red and
///          warnings yellow when @p color is set; notes are never coloured.
///          The function always emits a trailing newline.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
/// @param color Whether to wrap the severity in ANSI escapes.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm, bool color)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }

    const char *highlight = nullptr;
    if (color && diag.severity == Severity::Error)
        highlight = kAnsiRed;
    else if (color && diag.severity == Severity::Warning)
        highlight = kAnsiYellow;

    if (highlight)
        os << highlight << detail::diagSeverityToString(diag.severity) << kAnsiReset;
    else
        os << detail::diagSeverityToString(diag.severity);
    os << ": " << diag.message << '\n';
}
} // namespace folio::support
