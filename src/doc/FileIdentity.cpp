//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the file-system identity resolver.  Identities come from the
// device and inode numbers reported by stat(2), which makes them stable under
// relative-path aliasing: `./a.md`, `sub/../a.md` and an absolute path to the
// same file all resolve to one identity.  The reverse mapping walks a root
// directory and insists on exactly one match; hard links or a missing file are
// internal inconsistencies the caller must treat as fatal.
//
//===----------------------------------------------------------------------===//

#include "doc/FileIdentity.hpp"

#include "support/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <vector>

namespace folio::doc
{
namespace fs = std::filesystem;

std::string FileIdentity::anchorPrefix() const
{
    return "n" + std::to_string(inode);
}

FileSystemIdentityResolver::FileSystemIdentityResolver(std::string root) : root_(std::move(root))
{
    if (root_.empty())
        root_ = ".";
}

/// @brief Read the identity of @p path.
///
/// @details The call follows symbolic links so a link resolves to the file it
///          names.  Any stat(2) failure, including a missing file, is returned
///          as an error diagnostic carrying the system error text.
support::Expected<FileIdentity> FileSystemIdentityResolver::identify(const std::string &path) const
{
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
    {
        const int err = errno;
        return support::Expected<FileIdentity>(support::makeError(
            {}, "cannot resolve identity of \"" + path + "\": " + std::strerror(err)));
    }

    FileIdentity id;
    id.device = static_cast<uint64_t>(st.st_dev);
    id.inode = static_cast<uint64_t>(st.st_ino);
    return support::Expected<FileIdentity>(id);
}

/// @brief Find the single path under the root directory carrying @p id.
///
/// @details Unreadable directories are skipped.  Matches are reported in
///          normalized form relative to the root as it was given, so the
///          default root "." produces paths such as "doc/a.md".
support::Expected<std::string> FileSystemIdentityResolver::pathOf(const FileIdentity &id) const
{
    std::vector<std::string> matches;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        root_, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        return support::Expected<std::string>(support::makeError(
            {}, "cannot search \"" + root_ + "\" for " + id.anchorPrefix() + ": " + ec.message()));
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec))
    {
        if (ec)
            break;
        const fs::directory_entry &entry = *it;
        std::error_code entryEc;
        if (entry.is_symlink(entryEc) || !entry.is_regular_file(entryEc))
            continue;

        struct stat st{};
        const std::string candidate = entry.path().generic_string();
        if (::stat(candidate.c_str(), &st) != 0)
            continue;
        if (static_cast<uint64_t>(st.st_ino) == id.inode &&
            static_cast<uint64_t>(st.st_dev) == id.device)
        {
            matches.push_back(support::normalizePath(candidate));
        }
    }

    if (ec)
    {
        return support::Expected<std::string>(support::makeError(
            {}, "cannot search \"" + root_ + "\" for " + id.anchorPrefix() + ": " + ec.message()));
    }

    if (matches.empty())
    {
        return support::Expected<std::string>(support::makeError(
            {}, "no file under \"" + root_ + "\" has identity " + id.anchorPrefix()));
    }
    if (matches.size() > 1)
    {
        std::string message = "identity " + id.anchorPrefix() + " is ambiguous under \"" + root_ +
                              "\":";
        for (const auto &match : matches)
            message += " " + match;
        return support::Expected<std::string>(support::makeError({}, std::move(message)));
    }
    return support::Expected<std::string>(std::move(matches.front()));
}

} // namespace folio::doc
