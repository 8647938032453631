//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the `folio` executable: merges a multi-file markdown document into
// one pandoc-ready file after checking every link between the files.
//
//===----------------------------------------------------------------------===//

#include "tools/folio/cli.hpp"

#include <iostream>

/// @brief Entry point for the `folio` binary.
///
/// @details Report output goes to stdout; usage and internal errors to stderr.
int main(int argc, char **argv)
{
    return folio::tools::runCLI(argc, argv, std::cout, std::cerr);
}
