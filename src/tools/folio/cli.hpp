// File: src/tools/folio/cli.hpp
// Purpose: Declarations for folio option parsing, usage text and entry point.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: docs/codemap.md

#pragma once

#include "support/options.hpp"

#include <iosfwd>

namespace folio::doc
{
class IdentityResolver;
}

namespace folio::tools
{

/// @brief Result of attempting to parse a folio option.
enum class OptionParseResult
{
    NotMatched, ///< Argument is not an option (a path, or unknown).
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like an option but was malformed.
};

/// @brief Parse the option at @p index.
///
/// @param index Index of the current argument; advanced when a value is consumed.
/// @param argc Total number of arguments available.
/// @param argv Argument vector.
/// @param opts Accumulator receiving parsed option values.
/// @return Parsing outcome describing whether the argument was handled.
OptionParseResult parseOption(int &index, int argc, char **argv, folio::support::Options &opts);

/// @brief Print the synopsis and option list to @p os.
void usage(std::ostream &os);

/// @brief Execute the folio CLI workflow with injectable streams.
///
/// @param argc Argument count supplied by the caller.
/// @param argv Argument vector: program name, options, output, inputs.
/// @param out Stream receiving the report.
/// @param err Stream receiving usage and internal errors.
/// @param resolver Identity resolver; when null a FileSystemIdentityResolver
///        rooted at the `--root` directory is used.
/// @return Zero on success; one on usage, validation or internal failure.
int runCLI(int argc,
           char **argv,
           std::ostream &out,
           std::ostream &err,
           const folio::doc::IdentityResolver *resolver = nullptr);

} // namespace folio::tools
