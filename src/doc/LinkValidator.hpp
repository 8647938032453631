//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/LinkValidator.hpp
// Purpose: Declares the second pass: checking every link against the
//          completed label registry.
// Key invariants: The registry is only read; checks run in the order
//                 direct link, dead file, dead label, clash.
// Ownership/Lifetime: The validator borrows the registry and resolver, which
//                     must outlive it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "doc/FileIdentity.hpp"
#include "doc/LabelRegistry.hpp"
#include "doc/LinkError.hpp"
#include "doc/LinkScanner.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace folio::doc
{

/// @brief Classifies links as valid or as one of the LinkErrorKind failures.
class LinkValidator
{
  public:
    /// @param registry Completed label registry.
    /// @param resolver Identity resolver used for link targets.
    /// @param checkLocalLinks Also validate `](#label)` links against their own file.
    LinkValidator(const LabelRegistry &registry,
                  const IdentityResolver &resolver,
                  bool checkLocalLinks = false);

    /// @brief Classify a single link found in @p sourcePath.
    /// @return std::nullopt for a valid (or ignored local) link.
    [[nodiscard]] std::optional<LinkError> check(const std::string &sourcePath,
                                                 const Link &link) const;

    /// @brief Validate every link of one file.
    /// @param sourcePath Path of the file as given on input.
    /// @param fileId SourceManager id stamped on each error location.
    /// @param lines File contents.
    /// @return Errors in line order, or a fatal diagnostic for a malformed link.
    support::Expected<std::vector<LinkError>> validateFile(const std::string &sourcePath,
                                                           uint32_t fileId,
                                                           const std::vector<std::string> &lines) const;

    /// @brief Validate every input file (second pass).
    /// @details Inputs are registered with @p sm so error locations print
    ///          with their path.  Files without errors are left out of the
    ///          report.
    support::Expected<LinkReport> validateAll(const std::vector<std::string> &paths,
                                              support::SourceManager &sm) const;

  private:
    std::optional<LinkError> checkCrossFile(const std::string &sourcePath, const Link &link) const;
    std::optional<LinkError> checkLocal(const std::string &sourcePath, const Link &link) const;
    std::optional<LinkError> checkLabel(const FileIdentity &target,
                                        const std::string &targetPath,
                                        const std::string &label) const;

    const LabelRegistry &registry_;
    const IdentityResolver &resolver_;
    bool checkLocalLinks_;
};

} // namespace folio::doc
