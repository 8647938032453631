//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/FileIdentity.hpp
// Purpose: Declares the path-independent identity of markdown files and the
//          resolver mapping paths to identities and back.
// Key invariants: Two paths naming the same on-disk file yield equal
//                 identities; the anchor prefix always starts with a letter.
// Ownership/Lifetime: FileIdentity is a value type; resolvers hold no
//                     per-file state.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace folio::doc
{

/// @brief Stable token for an on-disk file, independent of the path used to reach it.
/// @invariant Equality compares both device and inode numbers.
struct FileIdentity
{
    uint64_t device = 0;
    uint64_t inode = 0;

    bool operator==(const FileIdentity &other) const = default;

    /// @brief Prefix used for every anchor generated for this file ("n<inode>").
    [[nodiscard]] std::string anchorPrefix() const;
};

/// @brief Hash functor so identities can key unordered containers.
struct FileIdentityHash
{
    size_t operator()(const FileIdentity &id) const noexcept
    {
        const size_t h1 = std::hash<uint64_t>{}(id.device);
        const size_t h2 = std::hash<uint64_t>{}(id.inode);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

/// @brief Maps paths to identities and identities back to paths.
///
/// The registry, validator and merger only talk to this interface, so tests
/// can substitute a deterministic table for the file system.
class IdentityResolver
{
  public:
    virtual ~IdentityResolver() = default;

    /// @brief Identity of the file at @p path.
    /// @return Identity, or an error diagnostic when the file cannot be inspected.
    virtual support::Expected<FileIdentity> identify(const std::string &path) const = 0;

    /// @brief Unique path of the file with identity @p id.
    /// @return Path, or an error diagnostic when no file or several files match.
    virtual support::Expected<std::string> pathOf(const FileIdentity &id) const = 0;
};

/// @brief Resolver backed by stat(2) and a walk of a root directory.
///
/// identify() reads the device and inode numbers of the path, following
/// symbolic links.  pathOf() walks @c root recursively and collects the
/// regular files carrying the identity; symbolic links are skipped so a link
/// and its target never count as two matches.
class FileSystemIdentityResolver final : public IdentityResolver
{
  public:
    explicit FileSystemIdentityResolver(std::string root = ".");

    support::Expected<FileIdentity> identify(const std::string &path) const override;

    support::Expected<std::string> pathOf(const FileIdentity &id) const override;

    const std::string &root() const
    {
        return root_;
    }

  private:
    std::string root_;
};

} // namespace folio::doc
