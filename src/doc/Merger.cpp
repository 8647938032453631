//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the merge pass.  Every file gets the anchor prefix of its
// identity.  Headings receive an explicit `{#<prefix>-<label>}` anchor and
// cross-file links `](./path.md#label)` become `](#<target prefix>-<label>)`,
// so the merged document only carries in-document anchors.  The pass runs
// after validation, so a target without identity here is an internal error.
//
//===----------------------------------------------------------------------===//

#include "doc/Merger.hpp"

#include "doc/Label.hpp"
#include "doc/LinkScanner.hpp"
#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

#include <fstream>

namespace folio::doc
{
namespace
{

std::string anchorRef(const std::string &prefix, const std::string &label)
{
    return "(#" + prefix + "-" + label + ")";
}

void rtrim(std::string &text)
{
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.pop_back();
}

} // namespace

Merger::Merger(const IdentityResolver &resolver, MergeSettings settings, std::ostream *trace)
    : resolver_(resolver), settings_(std::move(settings)), trace_(trace)
{
}

support::Expected<std::string> Merger::rewriteLinks(const std::string &sourcePath,
                                                    const std::string &prefix,
                                                    const std::string &line,
                                                    MergeStats *stats) const
{
    auto links = scanLine(line, 0);
    if (!links)
        return support::Expected<std::string>(links.error());

    std::string result;
    result.reserve(line.size());
    size_t copied = 0;
    for (const auto &link : links.value())
    {
        if (!link.label)
            continue;

        std::string replacement;
        if (link.kind == LinkKind::CrossFile)
        {
            const std::string targetPath = support::resolveSibling(sourcePath, link.target);
            auto target = resolver_.identify(targetPath);
            if (!target)
                return support::Expected<std::string>(target.error());
            replacement = anchorRef(target.value().anchorPrefix(), *link.label);
        }
        else if (settings_.rewriteLocalLinks)
        {
            replacement = anchorRef(prefix, *link.label);
        }
        else
        {
            continue;
        }

        result.append(line, copied, link.begin - copied);
        result += replacement;
        copied = link.end;
        if (stats)
            ++stats->links;
    }
    result.append(line, copied, std::string::npos);
    return support::Expected<std::string>(std::move(result));
}

/// @brief Rewrite links first, then append the heading anchor.
///
/// @details The label is taken from the original line so it matches the
///          registry even when the heading text itself contains links.
support::Expected<std::string> Merger::rewriteLine(const std::string &sourcePath,
                                                   const std::string &prefix,
                                                   const std::string &line,
                                                   MergeStats *stats) const
{
    auto rewritten = rewriteLinks(sourcePath, prefix, line, stats);
    if (!rewritten)
        return rewritten;

    if (auto label = headingLabel(line))
    {
        std::string &text = rewritten.value();
        rtrim(text);
        text += " {#" + prefix + "-" + *label + "}";
        if (stats)
            ++stats->anchors;
    }
    return rewritten;
}

support::Expected<MergeStats> Merger::mergeInto(std::ostream &out,
                                                const std::vector<std::string> &inputs) const
{
    MergeStats stats;
    for (const auto &input : inputs)
    {
        auto identity = resolver_.identify(input);
        if (!identity)
            return support::Expected<MergeStats>(identity.error());
        const std::string prefix = identity.value().anchorPrefix();

        auto lines = support::loadSourceLines(input);
        if (!lines)
            return support::Expected<MergeStats>(lines.error());

        for (const auto &line : lines.value())
        {
            auto rewritten = rewriteLine(input, prefix, line, &stats);
            if (!rewritten)
                return support::Expected<MergeStats>(rewritten.error());

            if (trace_ && rewritten.value() != line)
                *trace_ << "> [" << line << "]\n  [" << rewritten.value() << "]\n";

            out << rewritten.value() << '\n';
            ++stats.lines;
        }

        out << "\n\n" << settings_.pageBreak << "\n\n";
        out.flush();
        if (!out)
        {
            return support::Expected<MergeStats>(
                support::makeError({}, "write failed after merging \"" + input + "\""));
        }
        ++stats.files;
    }
    return support::Expected<MergeStats>(stats);
}

support::Expected<MergeStats> Merger::mergeTo(const std::string &outputPath,
                                              const std::vector<std::string> &inputs) const
{
    std::ofstream out(outputPath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out)
    {
        return support::Expected<MergeStats>(
            support::makeError({}, "cannot open output \"" + outputPath + "\""));
    }

    auto stats = mergeInto(out, inputs);
    out.close();
    if (stats && out.fail())
    {
        return support::Expected<MergeStats>(
            support::makeError({}, "cannot finish writing \"" + outputPath + "\""));
    }
    return stats;
}

} // namespace folio::doc
