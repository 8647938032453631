//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the link validator.  Each cross-file link is resolved relative to
// the directory of the file containing it, never to the working directory,
// and then classified:
//
//   1. no label                       -> DirectLink
//   2. target unknown to the registry -> DeadFileLink (identity failures too)
//   3. label not defined by target    -> DeadLabelLink
//   4. label defined more than once   -> LabelClash
//
// Failures attached to a single link never abort the pass; only malformed
// link shapes and unreadable inputs are returned as fatal diagnostics.
//
//===----------------------------------------------------------------------===//

#include "doc/LinkValidator.hpp"

#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

namespace folio::doc
{

LinkValidator::LinkValidator(const LabelRegistry &registry,
                             const IdentityResolver &resolver,
                             bool checkLocalLinks)
    : registry_(registry), resolver_(resolver), checkLocalLinks_(checkLocalLinks)
{
}

std::optional<LinkError> LinkValidator::checkLabel(const FileIdentity &target,
                                                   const std::string &targetPath,
                                                   const std::string &label) const
{
    if (!registry_.hasLabel(target, label))
        return LinkError{LinkErrorKind::DeadLabelLink, targetPath, label, {}};
    if (registry_.isClash(target, label))
        return LinkError{LinkErrorKind::LabelClash, targetPath, label, {}};
    return std::nullopt;
}

std::optional<LinkError> LinkValidator::checkCrossFile(const std::string &sourcePath,
                                                       const Link &link) const
{
    const std::string targetPath = support::resolveSibling(sourcePath, link.target);
    if (!link.label)
        return LinkError{LinkErrorKind::DirectLink, targetPath, {}, {}};

    auto identity = resolver_.identify(targetPath);
    if (!identity || !registry_.contains(identity.value()))
        return LinkError{LinkErrorKind::DeadFileLink, targetPath, *link.label, {}};

    return checkLabel(identity.value(), targetPath, *link.label);
}

std::optional<LinkError> LinkValidator::checkLocal(const std::string &sourcePath,
                                                   const Link &link) const
{
    if (!checkLocalLinks_ || !link.label)
        return std::nullopt;

    const std::string targetPath = support::normalizePath(sourcePath);
    auto identity = resolver_.identify(targetPath);
    if (!identity || !registry_.contains(identity.value()))
        return LinkError{LinkErrorKind::DeadFileLink, targetPath, *link.label, {}};

    return checkLabel(identity.value(), targetPath, *link.label);
}

std::optional<LinkError> LinkValidator::check(const std::string &sourcePath, const Link &link) const
{
    if (link.kind == LinkKind::Local)
        return checkLocal(sourcePath, link);
    return checkCrossFile(sourcePath, link);
}

support::Expected<std::vector<LinkError>> LinkValidator::validateFile(
    const std::string &sourcePath, uint32_t fileId, const std::vector<std::string> &lines) const
{
    auto links = scanLinks(lines);
    if (!links)
    {
        support::Diag diag = links.error();
        diag.loc.file_id = fileId;
        return support::Expected<std::vector<LinkError>>(std::move(diag));
    }

    std::vector<LinkError> errors;
    for (const auto &link : links.value())
    {
        if (auto error = check(sourcePath, link))
        {
            error->loc = support::SourceLoc{fileId, link.line, link.column};
            errors.push_back(std::move(*error));
        }
    }
    return support::Expected<std::vector<LinkError>>(std::move(errors));
}

support::Expected<LinkReport> LinkValidator::validateAll(const std::vector<std::string> &paths,
                                                         support::SourceManager &sm) const
{
    LinkReport report;
    for (const auto &path : paths)
    {
        const uint32_t fileId = sm.addFile(path);
        if (fileId == 0)
        {
            return support::Expected<LinkReport>(support::makeError(
                {}, std::string{support::kSourceManagerFileIdOverflowMessage}));
        }

        auto lines = support::loadSourceLines(path);
        if (!lines)
            return support::Expected<LinkReport>(lines.error());

        auto errors = validateFile(path, fileId, lines.value());
        if (!errors)
            return support::Expected<LinkReport>(errors.error());
        if (errors.value().empty())
            continue;

        report.push_back(FileLinkErrors{path, std::move(errors.value())});
    }
    return support::Expected<LinkReport>(std::move(report));
}

} // namespace folio::doc
