/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates the warnings and notes emitted while the label
 *     registry is built and keeps track of severity counts.  Diagnostics are
 *     stored until the pipeline explicitly prints them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace folio::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * Notes are stored but leave both counters unchanged.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output and ad-hoc
 * diagnostics printed by the tools look the same.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 * @param color Whether severities are highlighted with ANSI escapes.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm, bool color) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm, color);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace folio::support
