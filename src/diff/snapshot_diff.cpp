#include "diff/snapshot_diff.hpp"

#include <algorithm>
#include <set>

#include <QDir>
#include <QFileInfo>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "extract/name_resolver.hpp"
#include "store/snapshot_store.hpp"

namespace archscope {

namespace {

const std::string kMethodsKey = "methods";

// Registry that also maps duplicate names, to their first definition.
ArchitectureSnapshot withFirstDefinitions(const ArchitectureSnapshot &snapshot)
{
    ArchitectureSnapshot view = snapshot;
    for (const auto &duplicate : snapshot.duplicates) {
        view.registry.emplace(duplicate.qualifiedName(), duplicate.first().file);
    }
    return view;
}

std::string methodKey(const ImplBlock &impl, const Method &method)
{
    if (impl.traitName.has_value()) {
        return *impl.traitName + "::" + method.name;
    }
    return method.name;
}

void compareMember(const std::string &path,
                   const nlohmann::json &before,
                   const nlohmann::json &after,
                   std::vector<ArchitectureDiff::ChangedField> &changes)
{
    if (before != after) {
        changes.push_back({path, before, after});
    }
}

std::vector<ArchitectureDiff::ChangedField> changedFields(const nlohmann::json &before,
                                                          const nlohmann::json &after)
{
    std::vector<ArchitectureDiff::ChangedField> changes;
    if (!before.is_object() || !after.is_object()) {
        compareMember("signature", before, after, changes);
        return changes;
    }

    for (const char *key : {"kind", "visibility", "fields", "traits"}) {
        compareMember(key,
                      before.contains(key) ? before.at(key) : nlohmann::json(),
                      after.contains(key) ? after.at(key) : nlohmann::json(),
                      changes);
    }

    const nlohmann::json emptyMethods = nlohmann::json::object();
    const nlohmann::json &methodsBefore =
        before.contains(kMethodsKey) ? before.at(kMethodsKey) : emptyMethods;
    const nlohmann::json &methodsAfter =
        after.contains(kMethodsKey) ? after.at(kMethodsKey) : emptyMethods;
    std::set<std::string> names;
    for (const auto &item : methodsBefore.items()) {
        names.insert(item.key());
    }
    for (const auto &item : methodsAfter.items()) {
        names.insert(item.key());
    }
    for (const auto &name : names) {
        compareMember(kMethodsKey + "." + name,
                      methodsBefore.contains(name) ? methodsBefore.at(name) : nlohmann::json(),
                      methodsAfter.contains(name) ? methodsAfter.at(name) : nlohmann::json(),
                      changes);
    }
    return changes;
}

// Moves the methods of types present on both sides into their own
// "type::method" identities.
void splitMethods(std::map<std::string, nlohmann::json> &before,
                  std::map<std::string, nlohmann::json> &after)
{
    std::set<std::string> common;
    for (const auto &[name, value] : before) {
        if (after.contains(name)) {
            common.insert(name);
        }
    }

    for (auto *view : {&before, &after}) {
        for (const auto &name : common) {
            nlohmann::json &type = view->at(name);
            if (!type.contains(kMethodsKey)) {
                continue;
            }
            for (const auto &item : type.at(kMethodsKey).items()) {
                view->emplace(name + "::" + item.key(), item.value());
            }
            type.erase(kMethodsKey);
        }
    }
}

ArchitectureSnapshot readForDiff(const QString &directory)
{
    ArchitectureSnapshot snapshot;
    try {
        snapshot = SnapshotStore(snapshotDirectoryFor(directory)).read();
    } catch (const SnapshotReadError &error) {
        throw DiffIncompatibleError(directory.toStdString(), error.what());
    }
    // An arbitrary directory reads back as an empty snapshot.
    if (snapshot.units.empty()) {
        throw DiffIncompatibleError(directory.toStdString(),
                                    "not a snapshot directory (no .arch.json artifacts)");
    }
    return snapshot;
}

} // namespace

std::map<std::string, nlohmann::json> structuralView(const ArchitectureSnapshot &snapshot)
{
    const ArchitectureSnapshot view = withFirstDefinitions(snapshot);
    std::map<std::string, nlohmann::json> types;
    for (const auto &[name, path] : view.registry) {
        const TypeDefinition *type = view.findType(name);
        if (!type) {
            continue;
        }
        types[name] = nlohmann::json{
            {"kind", type->kind},
            {"visibility", type->visibility},
            {"fields", type->fields},
            {"traits", nlohmann::json::array()},
            {kMethodsKey, nlohmann::json::object()},
        };
    }

    const NameResolver resolver(view);
    for (const auto &[path, unit] : view.units) {
        for (const auto &impl : unit.impls) {
            const auto target = resolver.resolveImplTarget(unit, impl);
            if (!target.has_value() || !types.contains(*target)) {
                continue;
            }
            nlohmann::json &type = types[*target];
            if (impl.traitName.has_value()) {
                type["traits"].push_back(*impl.traitName);
            }
            nlohmann::json &methods = type[kMethodsKey];
            for (const auto &method : impl.methods) {
                const std::string key = methodKey(impl, method);
                if (!methods.contains(key)) {
                    methods[key] = method.signature;
                }
            }
        }
    }

    for (auto &[name, type] : types) {
        auto traits = type["traits"].get<std::vector<std::string>>();
        std::sort(traits.begin(), traits.end());
        traits.erase(std::unique(traits.begin(), traits.end()), traits.end());
        type["traits"] = traits;
    }
    return types;
}

ArchitectureDiff diffSnapshots(const ArchitectureSnapshot &before,
                               const ArchitectureSnapshot &after,
                               DiffGranularity granularity)
{
    ArchitectureDiff diff;
    diff.granularity = granularity;

    auto viewBefore = structuralView(before);
    auto viewAfter = structuralView(after);
    if (granularity == DiffGranularity::Method) {
        splitMethods(viewBefore, viewAfter);
    }

    std::set<std::string> identities;
    for (const auto &[name, value] : viewBefore) {
        identities.insert(name);
    }
    for (const auto &[name, value] : viewAfter) {
        identities.insert(name);
    }

    for (const auto &identity : identities) {
        const auto oldIt = viewBefore.find(identity);
        const auto newIt = viewAfter.find(identity);
        if (oldIt == viewBefore.end()) {
            diff.added.emplace(identity, newIt->second);
        } else if (newIt == viewAfter.end()) {
            diff.removed.emplace(identity, oldIt->second);
        } else if (oldIt->second == newIt->second) {
            diff.unchanged.insert(identity);
        } else {
            ArchitectureDiff::Modification modification;
            modification.before = oldIt->second;
            modification.after = newIt->second;
            modification.changedFields = changedFields(oldIt->second, newIt->second);
            diff.modified.emplace(identity, std::move(modification));
        }
    }

    ALOG_DEBUG(QStringLiteral("DiffEngine"),
               QStringLiteral("diffSnapshots"),
               QStringLiteral("snapshots_compared"),
               QStringLiteral("diff_requested"),
               QStringLiteral("structural_compare"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"added", diff.added.size()},
                               {"removed", diff.removed.size()},
                               {"modified", diff.modified.size()},
                               {"unchanged", diff.unchanged.size()}}));
    return diff;
}

QString snapshotDirectoryFor(const QString &directory)
{
    const QDir dir(directory);
    const QString nested = dir.filePath(QStringLiteral("architecture"));
    if (QFileInfo(nested).isDir()) {
        return nested;
    }
    return directory;
}

ArchitectureDiff diffDirectories(const QString &directoryA,
                                 const QString &directoryB,
                                 DiffGranularity granularity)
{
    const ArchitectureSnapshot before = readForDiff(directoryA);
    const ArchitectureSnapshot after = readForDiff(directoryB);

    ArchitectureDiff diff = diffSnapshots(before, after, granularity);
    diff.snapshotAId = directoryA.toStdString();
    diff.snapshotBId = directoryB.toStdString();
    return diff;
}

} // namespace archscope
