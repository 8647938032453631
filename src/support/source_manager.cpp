//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking the input
// files referenced by diagnostics.  The manager assigns small numeric
// identifiers to paths and resolves them back to normalized strings when the
// report is printed.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"
#include "support/path_utils.hpp"

#include <iostream>
#include <limits>

namespace folio::support
{

/// @brief Register a file path and assign it a stable identifier.
///
/// @details The path is lexically normalized so `./a.md` and `a.md` print the
///          same way.  Identifiers start at one, leaving zero to represent an
///          unknown location.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path, 0 on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(path);

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace folio::support
