//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the merge pipeline.  The three passes run strictly in sequence:
//
//   1. build the label registry over every input and warn about clashes,
//   2. validate every link against the finished registry,
//   3. rewrite and concatenate the inputs into the output file.
//
// Any failure before the third pass leaves the output path untouched.
//
//===----------------------------------------------------------------------===//

#include "doc/Pipeline.hpp"

#include "doc/LabelRegistry.hpp"
#include "doc/LinkError.hpp"
#include "doc/LinkValidator.hpp"
#include "doc/Merger.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <ostream>

namespace folio::doc
{
namespace
{

void printBanner(const support::Options &opts, std::ostream &out)
{
    out << "Target: " << opts.output << '\n' << "Input: ";
    for (const auto &input : opts.inputs)
        out << ' ' << input;
    out << "\n\n";
}

/// @brief Reject an output path that names one of the inputs.
/// @details Truncating it would destroy the input before it is read.
support::Expected<void> checkOutputDistinct(const support::Options &opts,
                                            const IdentityResolver &resolver)
{
    auto output = resolver.identify(opts.output);
    if (!output)
        return {}; // Output does not exist yet.

    for (const auto &input : opts.inputs)
    {
        auto identity = resolver.identify(input);
        if (identity && identity.value() == output.value())
        {
            return support::Expected<void>(support::makeError(
                {}, "output \"" + opts.output + "\" is also an input (\"" + input + "\")"));
        }
    }
    return {};
}

} // namespace

PipelineResult runMergePipeline(const support::Options &opts,
                                const IdentityResolver &resolver,
                                std::ostream &out,
                                std::ostream &err)
{
    if (!opts.quiet)
        printBanner(opts, out);

    if (auto distinct = checkOutputDistinct(opts, resolver); !distinct)
    {
        support::printDiag(distinct.error(), err, nullptr, opts.color);
        return PipelineResult::Failed;
    }

    auto registry = buildRegistry(opts.inputs, resolver);
    if (!registry)
    {
        support::printDiag(registry.error(), err, nullptr, opts.color);
        return PipelineResult::Failed;
    }

    support::DiagnosticEngine diags;
    if (auto clashes = reportClashes(registry.value(), resolver, diags); !clashes)
    {
        support::printDiag(clashes.error(), err, nullptr, opts.color);
        return PipelineResult::Failed;
    }
    if (diags.size() != 0)
    {
        diags.printAll(out, nullptr, opts.color);
        out << '\n';
    }

    if (!opts.quiet)
    {
        out << "context:\n";
        registry.value().dump(out);
        out << '\n';
    }

    support::SourceManager sm;
    LinkValidator validator(registry.value(), resolver, opts.localLinks);
    auto report = validator.validateAll(opts.inputs, sm);
    if (!report)
    {
        support::printDiag(report.error(), err, &sm, opts.color);
        return PipelineResult::Failed;
    }
    if (!report.value().empty())
    {
        const size_t count = errorCount(report.value());
        support::printDiag(support::makeError({},
                                              std::to_string(count) + " invalid link" +
                                                  (count == 1 ? "" : "s") + ", nothing written"),
                           out,
                           nullptr,
                           opts.color);
        printLinkReport(report.value(), out, sm, opts.color);
        return PipelineResult::LinkErrors;
    }

    MergeSettings settings;
    settings.pageBreak = opts.pageBreak;
    settings.rewriteLocalLinks = opts.localLinks;
    Merger merger(resolver, settings, opts.trace ? &out : nullptr);
    auto stats = merger.mergeTo(opts.output, opts.inputs);
    if (!stats)
    {
        support::printDiag(stats.error(), err, nullptr, opts.color);
        return PipelineResult::Failed;
    }

    if (!opts.quiet)
    {
        out << "merged " << stats.value().files << " file(s) into " << opts.output << ": "
            << stats.value().anchors << " anchor(s), " << stats.value().links
            << " link(s) rewritten\n";
    }
    return PipelineResult::Merged;
}

} // namespace folio::doc
