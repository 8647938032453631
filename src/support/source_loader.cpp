//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loader.cpp
// Purpose: Standardise how the pipeline loads markdown inputs into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: Returned buffers are owned by the caller.
// Links: src/support/source_loader.hpp, docs/codemap.md#support
//
//===----------------------------------------------------------------------===//

#include "support/source_loader.hpp"

#include <fstream>
#include <sstream>

namespace folio::support
{

Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return Expected<std::string>(makeError({}, "unable to open " + path));
    }

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return Expected<std::string>(
            makeError({}, "source file too large: " + path + " (limit: 256 MB)"));
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return Expected<std::string>(makeError({}, "out of memory reading " + path));
    }
}

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string::npos)
            end = text.size();
        size_t stop = end;
        if (stop > start && text[stop - 1] == '\r')
            --stop;
        lines.emplace_back(text, start, stop - start);
        start = end + 1;
    }
    return lines;
}

Expected<std::vector<std::string>> loadSourceLines(const std::string &path)
{
    auto contents = loadSourceFile(path);
    if (!contents)
        return Expected<std::vector<std::string>>(contents.error());
    return Expected<std::vector<std::string>>(splitLines(contents.value()));
}

} // namespace folio::support
