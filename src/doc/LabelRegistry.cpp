//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the label registry.  The registry is filled file by file during
// the first pass: the first occurrence of a label within a file is canonical,
// later occurrences only mark the label as clashing.  Clash detection is
// strictly per file; two files may define the same label freely because their
// anchors carry different identity prefixes.
//
//===----------------------------------------------------------------------===//

#include "doc/LabelRegistry.hpp"

#include "doc/Label.hpp"
#include "support/source_loader.hpp"

namespace folio::doc
{

bool LabelSet::insert(const std::string &label)
{
    if (!lookup_.insert(label).second)
        return false;
    ordered_.push_back(label);
    return true;
}

FileLabels &LabelRegistry::entry(const FileIdentity &file)
{
    auto [it, inserted] = index_.try_emplace(file, files_.size());
    if (inserted)
    {
        FileLabels fresh;
        fresh.identity = file;
        files_.push_back(std::move(fresh));
    }
    return files_[it->second];
}

/// @brief Record one heading label.
///
/// @details A repeat never touches the label set; it lands in the clash set,
///          which ignores further repeats, so a label clashes at most once in
///          the bookkeeping however often it is repeated.
InsertResult LabelRegistry::addLabel(const FileIdentity &file, const std::string &label)
{
    FileLabels &labels = entry(file);
    if (labels.labels.insert(label))
        return InsertResult::Inserted;
    labels.clashes.insert(label);
    return InsertResult::Clashed;
}

void LabelRegistry::addFile(const FileIdentity &file, const std::vector<std::string> &lines)
{
    entry(file);
    for (const auto &label : extractLabels(lines))
        addLabel(file, label);
}

const FileLabels *LabelRegistry::find(const FileIdentity &file) const
{
    auto it = index_.find(file);
    if (it == index_.end())
        return nullptr;
    return &files_[it->second];
}

bool LabelRegistry::hasLabel(const FileIdentity &file, const std::string &label) const
{
    const FileLabels *labels = find(file);
    return labels && labels->labels.contains(label);
}

bool LabelRegistry::isClash(const FileIdentity &file, const std::string &label) const
{
    const FileLabels *labels = find(file);
    return labels && labels->clashes.contains(label);
}

void LabelRegistry::dump(std::ostream &os) const
{
    for (const auto &file : files_)
    {
        os << file.identity.anchorPrefix() << " ->";
        const auto &ordered = file.labels.ordered();
        for (size_t i = 0; i < ordered.size(); ++i)
            os << (i == 0 ? " " : ", ") << ordered[i];
        os << '\n';
    }
}

support::Expected<LabelRegistry> buildRegistry(const std::vector<std::string> &paths,
                                               const IdentityResolver &resolver)
{
    LabelRegistry registry;
    for (const auto &path : paths)
    {
        auto identity = resolver.identify(path);
        if (!identity)
            return support::Expected<LabelRegistry>(identity.error());

        auto lines = support::loadSourceLines(path);
        if (!lines)
            return support::Expected<LabelRegistry>(lines.error());

        registry.addFile(identity.value(), lines.value());
    }
    return support::Expected<LabelRegistry>(std::move(registry));
}

support::Expected<void> reportClashes(const LabelRegistry &registry,
                                      const IdentityResolver &resolver,
                                      support::DiagnosticEngine &diags)
{
    std::vector<support::Diag> notes;
    for (const auto &file : registry.files())
    {
        if (file.clashes.empty())
            continue;

        auto path = resolver.pathOf(file.identity);
        if (!path)
            return support::Expected<void>(path.error());

        const auto &clashes = file.clashes.ordered();
        std::string message = "in file \"" + path.value() + "\" for label";
        if (clashes.size() > 1)
            message += 's';
        for (size_t i = 0; i < clashes.size(); ++i)
            message += (i == 0 ? " " : ", ") + clashes[i];
        notes.push_back(support::makeNote({}, std::move(message)));
    }

    if (notes.empty())
        return {};

    diags.report(support::makeWarning(
        {}, "some sections have the same name and therefore the same label"));
    for (auto &note : notes)
        diags.report(std::move(note));
    return {};
}

} // namespace folio::doc
