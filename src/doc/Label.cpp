//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/Label.cpp
// Purpose: Implements heading detection and label normalization.
// Key invariants: The registry and the merger derive labels through the same
//                 functions, so anchors always agree with the validated view.
// Ownership/Lifetime: Stateless.
// Links: doc/Label.hpp
//
//===----------------------------------------------------------------------===//

#include "doc/Label.hpp"

namespace folio::doc
{
namespace
{

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

bool isSeparator(char c)
{
    return isBlank(c) || c == '/' || c == '-';
}

bool isDropped(char c)
{
    return c == ',' || c == '.' || c == '`';
}

char toLowerAscii(char c)
{
    if (c >= 'A' && c <= 'Z')
        return static_cast<char>(c - 'A' + 'a');
    return c;
}

} // namespace

bool isHeadingLine(std::string_view line)
{
    return !line.empty() && line.front() == '#';
}

std::string_view headingText(std::string_view line)
{
    if (!isHeadingLine(line))
        return {};
    size_t pos = 0;
    while (pos < line.size() && line[pos] == '#')
        ++pos;
    while (pos < line.size() && isBlank(line[pos]))
        ++pos;
    return line.substr(pos);
}

std::string normalizeLabel(std::string_view text)
{
    std::string label;
    label.reserve(text.size());
    bool pendingSeparator = false;
    for (char c : text)
    {
        if (isSeparator(c))
        {
            pendingSeparator = true;
            continue;
        }
        if (isDropped(c))
            continue;
        if (pendingSeparator && !label.empty())
            label.push_back('-');
        pendingSeparator = false;
        label.push_back(toLowerAscii(c));
    }
    return label;
}

std::optional<std::string> headingLabel(std::string_view line)
{
    if (!isHeadingLine(line))
        return std::nullopt;
    std::string label = normalizeLabel(headingText(line));
    if (label.empty())
        return std::nullopt;
    return label;
}

std::vector<std::string> extractLabels(const std::vector<std::string> &lines)
{
    std::vector<std::string> labels;
    for (const auto &line : lines)
    {
        if (auto label = headingLabel(line))
            labels.push_back(std::move(*label));
    }
    return labels;
}

} // namespace folio::doc
