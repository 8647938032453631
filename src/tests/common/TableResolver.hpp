//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/TableResolver.hpp
// Purpose: Deterministic IdentityResolver backed by an in-memory table.
// Key invariants: Paths are normalized before lookup, so "./a.md" and "a.md"
//                 share an identity.
// Ownership/Lifetime: Owns its table.
// Links: src/doc/FileIdentity.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "doc/FileIdentity.hpp"
#include "support/path_utils.hpp"

#include <map>
#include <string>

namespace folio::tests
{

class TableResolver final : public folio::doc::IdentityResolver
{
  public:
    /// @brief Assign inode @p inode to @p path (device 1).
    void add(const std::string &path, uint64_t inode)
    {
        table_[folio::support::normalizePath(path)] = folio::doc::FileIdentity{1, inode};
    }

    folio::support::Expected<folio::doc::FileIdentity> identify(const std::string &path) const override
    {
        auto it = table_.find(folio::support::normalizePath(path));
        if (it == table_.end())
        {
            return folio::support::Expected<folio::doc::FileIdentity>(
                folio::support::makeError({}, "no identity for " + path));
        }
        return folio::support::Expected<folio::doc::FileIdentity>(it->second);
    }

    folio::support::Expected<std::string> pathOf(const folio::doc::FileIdentity &id) const override
    {
        std::string found;
        int matches = 0;
        for (const auto &[path, identity] : table_)
        {
            if (identity == id)
            {
                found = path;
                ++matches;
            }
        }
        if (matches != 1)
        {
            return folio::support::Expected<std::string>(
                folio::support::makeError({}, "no unique path for " + id.anchorPrefix()));
        }
        return folio::support::Expected<std::string>(found);
    }

  private:
    std::map<std::string, folio::doc::FileIdentity> table_;
};

} // namespace folio::tests
