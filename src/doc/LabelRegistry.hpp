//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/LabelRegistry.hpp
// Purpose: Declares the per-file label and clash bookkeeping built in the
//          first pass and consulted by the validator.
// Key invariants: Every clash label of a file is also one of its labels;
//                 a label is stored at most once in each set.
// Ownership/Lifetime: The registry owns all label strings; it is built once
//                     and handed to later passes by const reference.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "doc/FileIdentity.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace folio::doc
{

/// @brief Insertion-ordered set of labels.
class LabelSet
{
  public:
    /// @brief Insert @p label unless present.
    /// @return True when the label was not present before.
    bool insert(const std::string &label);

    [[nodiscard]] bool contains(const std::string &label) const
    {
        return lookup_.count(label) != 0;
    }

    [[nodiscard]] bool empty() const
    {
        return ordered_.empty();
    }

    [[nodiscard]] size_t size() const
    {
        return ordered_.size();
    }

    /// @brief Labels in first-insertion order.
    [[nodiscard]] const std::vector<std::string> &ordered() const
    {
        return ordered_;
    }

  private:
    std::vector<std::string> ordered_;
    std::unordered_set<std::string> lookup_;
};

/// @brief Labels and clashes recorded for one file.
struct FileLabels
{
    FileIdentity identity;
    LabelSet labels;
    LabelSet clashes;
};

/// @brief Outcome of LabelRegistry::addLabel.
enum class InsertResult
{
    Inserted, ///< First occurrence; stored in the file's labels.
    Clashed   ///< Repeat; the label is (now) listed among the file's clashes.
};

/// @brief Maps file identities to their labels and clashing labels.
class LabelRegistry
{
  public:
    /// @brief Record @p label for @p file.
    InsertResult addLabel(const FileIdentity &file, const std::string &label);

    /// @brief Record every heading label of @p lines for @p file.
    /// @details Registers @p file even when it defines no heading, so links
    ///          to it are reported as dead labels rather than dead files.
    void addFile(const FileIdentity &file, const std::vector<std::string> &lines);

    /// @brief Entry for @p file, or nullptr when the file is unknown.
    [[nodiscard]] const FileLabels *find(const FileIdentity &file) const;

    [[nodiscard]] bool contains(const FileIdentity &file) const
    {
        return find(file) != nullptr;
    }

    [[nodiscard]] bool hasLabel(const FileIdentity &file, const std::string &label) const;

    [[nodiscard]] bool isClash(const FileIdentity &file, const std::string &label) const;

    /// @brief Entries in registration order.
    [[nodiscard]] const std::vector<FileLabels> &files() const
    {
        return files_;
    }

    /// @brief Print one "<prefix> -> label, label" line per file.
    void dump(std::ostream &os) const;

  private:
    FileLabels &entry(const FileIdentity &file);

    std::vector<FileLabels> files_;
    std::unordered_map<FileIdentity, size_t, FileIdentityHash> index_;
};

/// @brief Build the registry over @p paths (first pass).
/// @return Registry, or an error when a file cannot be read or identified.
support::Expected<LabelRegistry> buildRegistry(const std::vector<std::string> &paths,
                                               const IdentityResolver &resolver);

/// @brief Report files defining the same label twice.
///
/// Emits one warning plus one note per affected file into @p diags.  Files are
/// named through IdentityResolver::pathOf; a failing lookup is returned as an
/// error since it indicates inconsistent file identities.
support::Expected<void> reportClashes(const LabelRegistry &registry,
                                      const IdentityResolver &resolver,
                                      support::DiagnosticEngine &diags);

} // namespace folio::doc
