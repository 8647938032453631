//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: doc/Pipeline.hpp
// Purpose: Declares the three-pass merge pipeline shared by the CLI and tests.
// Key invariants: The output file is only opened once the registry is built
//                 and every link validated.
// Ownership/Lifetime: All intermediate state is local to one call.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "doc/FileIdentity.hpp"
#include "support/options.hpp"

#include <iosfwd>

namespace folio::doc
{

/// @brief How a pipeline run ended.
enum class PipelineResult
{
    Merged,     ///< Output written.
    LinkErrors, ///< Validation failed; output untouched.
    Failed      ///< Internal or I/O failure.
};

/// @brief Build the registry, validate links and merge the inputs.
///
/// @param opts Inputs, output path and rewrite settings.
/// @param resolver File identity resolver.
/// @param out Receives the report: banner, clash warnings, context dump and
///        link errors.
/// @param err Receives internal and I/O failures.
PipelineResult runMergePipeline(const support::Options &opts,
                                const IdentityResolver &resolver,
                                std::ostream &out,
                                std::ostream &err);

} // namespace folio::doc
