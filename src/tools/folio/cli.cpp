//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line handling for the folio tool: option decoding,
// usage text and the mapping from pipeline outcomes to exit status.  The
// merge itself lives in doc/Pipeline.cpp so tests can drive it directly.
//
//===----------------------------------------------------------------------===//

#include "tools/folio/cli.hpp"

#include "doc/FileIdentity.hpp"
#include "doc/Pipeline.hpp"
#include "folio/version.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace folio::tools
{
namespace
{

/// @brief Print usage followed by an error line.
int usageError(std::ostream &err, const std::string &message)
{
    usage(err);
    err << '\n';
    folio::support::printDiag(folio::support::makeError({}, message), err);
    return 1;
}

/// @brief Value of `--name=value` or of the argument following `--name`.
/// @return False when the value is missing.
bool takeValue(int &index,
               int argc,
               char **argv,
               std::string_view name,
               std::string &value)
{
    const std::string_view arg(argv[index]);
    if (arg == name)
    {
        if (index + 1 >= argc)
            return false;
        value = argv[++index];
        return true;
    }
    value = std::string(arg.substr(name.size() + 1));
    return true;
}

bool matchesValued(std::string_view arg, std::string_view name)
{
    return arg == name || (arg.size() > name.size() && arg.starts_with(name) &&
                           arg[name.size()] == '=');
}

} // namespace

OptionParseResult parseOption(int &index, int argc, char **argv, folio::support::Options &opts)
{
    const std::string_view arg(argv[index]);
    if (arg == "--local-links")
    {
        opts.localLinks = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--trace")
    {
        opts.trace = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--color")
    {
        opts.color = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--quiet" || arg == "-q")
    {
        opts.quiet = true;
        return OptionParseResult::Parsed;
    }
    if (matchesValued(arg, "--root"))
    {
        if (!takeValue(index, argc, argv, "--root", opts.identityRoot) ||
            opts.identityRoot.empty())
            return OptionParseResult::Error;
        return OptionParseResult::Parsed;
    }
    if (matchesValued(arg, "--page-break"))
    {
        if (!takeValue(index, argc, argv, "--page-break", opts.pageBreak))
            return OptionParseResult::Error;
        return OptionParseResult::Parsed;
    }
    return OptionParseResult::NotMatched;
}

void usage(std::ostream &os)
{
    os << "folio v" << FOLIO_VERSION_STR << "\n"
       << "Usage: folio [options] <out> <in>...\n"
       << "  Checks the links between the files of a multi-file markdown document\n"
       << "  and writes a single markdown file that can be passed to pandoc.\n"
       << "  The merged document follows the order of the input files.\n"
       << "\n"
       << "  <out>                 File the merged document is written to\n"
       << "  <in>                  Markdown file of the document\n"
       << "\n"
       << "Options:\n"
       << "  --root DIR            Directory searched when naming files by identity\n"
       << "  --page-break TEXT     Marker written after each file (default \\newpage)\n"
       << "  --local-links         Also check and rewrite (#label) links\n"
       << "  --trace               Print every line changed by the rewrite\n"
       << "  --color               Highlight errors and warnings\n"
       << "  -q, --quiet           Omit banner, context dump and summary\n"
       << "  -h, --help            Show this help message\n"
       << "  --version             Show version information\n";
}

int runCLI(int argc,
           char **argv,
           std::ostream &out,
           std::ostream &err,
           const folio::doc::IdentityResolver *resolver)
{
    folio::support::Options opts;
    std::vector<std::string> positional;
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (!optionsDone)
        {
            if (arg == "--")
            {
                optionsDone = true;
                continue;
            }
            if (arg == "-h" || arg == "--help")
            {
                usage(out);
                return 0;
            }
            if (arg == "--version")
            {
                out << "folio v" << FOLIO_VERSION_STR << "\n";
                return 0;
            }

            switch (parseOption(i, argc, argv, opts))
            {
                case OptionParseResult::Parsed:
                    continue;
                case OptionParseResult::Error:
                    return usageError(err, "missing or invalid value for " + std::string(arg));
                case OptionParseResult::NotMatched:
                    break;
            }
            if (arg.size() > 1 && arg.front() == '-')
                return usageError(err, "unknown option " + std::string(arg));
        }
        positional.emplace_back(arg);
    }

    if (positional.empty())
        return usageError(err, "no arguments, need at least two.");
    if (positional.size() == 1)
        return usageError(err, "no input file given, need at least one.");

    opts.output = positional.front();
    opts.inputs.assign(positional.begin() + 1, positional.end());

    folio::doc::FileSystemIdentityResolver fsResolver(opts.identityRoot);
    const folio::doc::IdentityResolver &active = resolver ? *resolver : fsResolver;

    switch (folio::doc::runMergePipeline(opts, active, out, err))
    {
        case folio::doc::PipelineResult::Merged:
            return 0;
        case folio::doc::PipelineResult::LinkErrors:
        case folio::doc::PipelineResult::Failed:
            return 1;
    }
    return 1;
}

} // namespace folio::tools
