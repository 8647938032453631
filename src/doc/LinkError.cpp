//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/LinkError.cpp
// Purpose: Formatting of link validation failures.
// Key invariants: One output line per error.
// Ownership/Lifetime: Stateless.
// Links: doc/LinkError.hpp
//
//===----------------------------------------------------------------------===//

#include "doc/LinkError.hpp"

#include "support/diag_expected.hpp"

namespace folio::doc
{

const char *linkErrorKindName(LinkErrorKind kind)
{
    switch (kind)
    {
        case LinkErrorKind::LabelClash:
            return "label-clash";
        case LinkErrorKind::DeadLabelLink:
            return "dead-label-link";
        case LinkErrorKind::DeadFileLink:
            return "dead-file-link";
        case LinkErrorKind::DirectLink:
            return "direct-link";
    }
    return "";
}

std::string describe(const LinkError &error)
{
    std::string text;
    switch (error.kind)
    {
        case LinkErrorKind::LabelClash:
            text = "link to overloaded label \"" + error.label + "\" in file \"" +
                   error.targetFile + "\"";
            break;
        case LinkErrorKind::DeadLabelLink:
            text = "link to inexistent label \"" + error.label + "\" in file \"" +
                   error.targetFile + "\"";
            break;
        case LinkErrorKind::DeadFileLink:
            text = "link to inexistent file \"" + error.targetFile + "\" (label is \"" +
                   error.label + "\")";
            break;
        case LinkErrorKind::DirectLink:
            text = "direct link to file \"" + error.targetFile + "\"";
            break;
    }
    text += " [";
    text += linkErrorKindName(error.kind);
    text += ']';
    return text;
}

size_t errorCount(const LinkReport &report)
{
    size_t count = 0;
    for (const auto &file : report)
        count += file.errors.size();
    return count;
}

void printLinkReport(const LinkReport &report,
                     std::ostream &os,
                     const support::SourceManager &sm,
                     bool color)
{
    for (const auto &file : report)
    {
        os << "on file " << file.sourceFile << '\n';
        for (const auto &error : file.errors)
        {
            os << "  ";
            support::printDiag(support::makeError(error.loc, describe(error)), os, &sm, color);
        }
    }
}

} // namespace folio::doc
