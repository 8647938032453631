//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements link extraction.  The scanner walks each line looking for the
// "](" that closes a markdown link text and inspects the target up to the
// next ')'.  Targets starting with "./" and naming a markdown file are
// cross-file links; targets starting with '#' are local links; everything else
// (external URLs, images, paths without the "./" prefix) is left alone.
//
//===----------------------------------------------------------------------===//

#include "doc/LinkScanner.hpp"

namespace folio::doc
{
namespace
{

bool containsBlank(std::string_view text)
{
    return text.find_first_of(" \t") != std::string_view::npos;
}

bool endsWith(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool hasMarkdownSuffix(std::string_view path)
{
    return endsWith(path, ".md") || endsWith(path, ".markdown");
}

support::Expected<std::vector<Link>> scanLine(std::string_view line, uint32_t lineNo)
{
    std::vector<Link> links;
    size_t pos = 0;
    while ((pos = line.find("](", pos)) != std::string_view::npos)
    {
        const size_t open = pos + 1;
        const size_t close = line.find(')', open + 1);
        if (close == std::string_view::npos)
            break;

        const std::string_view inner = line.substr(open + 1, close - open - 1);
        Link link;
        link.line = lineNo;
        link.column = static_cast<uint32_t>(open + 1);
        link.begin = open;
        link.end = close + 1;

        if (inner.starts_with("./"))
        {
            const size_t hash = inner.find('#');
            const std::string_view path = inner.substr(0, hash);
            if (containsBlank(path) || !hasMarkdownSuffix(path))
            {
                pos = open + 1;
                continue;
            }

            link.kind = LinkKind::CrossFile;
            link.target.assign(path);
            if (hash != std::string_view::npos)
            {
                const std::string_view label = inner.substr(hash + 1);
                if (label.find('#') != std::string_view::npos)
                {
                    return support::Expected<std::vector<Link>>(support::makeError(
                        {0, lineNo, link.column},
                        "malformed link target \"" + std::string(inner) +
                            "\": more than one '#'"));
                }
                if (!label.empty())
                    link.label = std::string(label);
            }
            links.push_back(std::move(link));
        }
        else if (inner.size() > 1 && inner.front() == '#' && !containsBlank(inner))
        {
            link.kind = LinkKind::Local;
            link.label = std::string(inner.substr(1));
            links.push_back(std::move(link));
        }
        pos = close + 1;
    }
    return support::Expected<std::vector<Link>>(std::move(links));
}

support::Expected<std::vector<Link>> scanLinks(const std::vector<std::string> &lines)
{
    std::vector<Link> links;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        auto lineLinks = scanLine(lines[i], static_cast<uint32_t>(i + 1));
        if (!lineLinks)
            return lineLinks;
        for (auto &link : lineLinks.value())
            links.push_back(std::move(link));
    }
    return support::Expected<std::vector<Link>>(std::move(links));
}

} // namespace folio::doc
