//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/Merger.hpp
// Purpose: Declares the third pass: rewriting anchors and links and
//          concatenating the inputs into one document.
// Key invariants: Inputs are emitted in the order given; heading anchors use
//                 the same labels the registry recorded.
// Ownership/Lifetime: The merger borrows its resolver; the output stream is
//                     owned by mergeTo() for the duration of the call.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "doc/FileIdentity.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace folio::doc
{

/// @brief Settings of the rewrite pass.
struct MergeSettings
{
    /// Marker emitted, surrounded by blank lines, after every input file.
    std::string pageBreak = "\\newpage";
    /// Rewrite `](#label)` links with the prefix of their own file.
    bool rewriteLocalLinks = false;
};

/// @brief Counters gathered while merging.
struct MergeStats
{
    size_t files = 0;
    size_t lines = 0;
    size_t anchors = 0; ///< Headings that received an explicit anchor.
    size_t links = 0;   ///< Links retargeted to an in-document anchor.
};

/// @brief Rewrites validated inputs into a single document.
class Merger
{
  public:
    /// @param resolver Identity resolver providing anchor prefixes.
    /// @param settings Rewrite settings.
    /// @param trace Optional stream receiving every changed line.
    Merger(const IdentityResolver &resolver, MergeSettings settings, std::ostream *trace = nullptr);

    /// @brief Rewrite one line of @p sourcePath whose anchor prefix is @p prefix.
    /// @param stats Optional counters updated for each anchor or link.
    /// @return The rewritten line, or an error when a link target has no identity.
    support::Expected<std::string> rewriteLine(const std::string &sourcePath,
                                               const std::string &prefix,
                                               const std::string &line,
                                               MergeStats *stats = nullptr) const;

    /// @brief Stream every input into @p out in order.
    /// @details Each line is written as soon as it is rewritten; on failure the
    ///          stream keeps whatever was written before.
    support::Expected<MergeStats> mergeInto(std::ostream &out,
                                            const std::vector<std::string> &inputs) const;

    /// @brief Create (truncate) @p outputPath and merge @p inputs into it.
    /// @details The file is closed on every return path.  A failure after
    ///          writing began leaves a partial file behind.
    support::Expected<MergeStats> mergeTo(const std::string &outputPath,
                                          const std::vector<std::string> &inputs) const;

  private:
    support::Expected<std::string> rewriteLinks(const std::string &sourcePath,
                                                const std::string &prefix,
                                                const std::string &line,
                                                MergeStats *stats) const;

    const IdentityResolver &resolver_;
    MergeSettings settings_;
    std::ostream *trace_;
};

} // namespace folio::doc
