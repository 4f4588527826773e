#include "common/snapshot.hpp"

namespace archscope {

const TypeDefinition *ArchitectureSnapshot::findType(const std::string &qualifiedName) const
{
    const auto owner = registry.find(qualifiedName);
    if (owner == registry.end()) {
        return nullptr;
    }
    const SourceUnit *unit = findUnit(owner->second);
    if (!unit) {
        return nullptr;
    }
    for (const auto &type : unit->types) {
        if (type.qualifiedName == qualifiedName) {
            return &type;
        }
    }
    return nullptr;
}

const SourceUnit *ArchitectureSnapshot::findUnit(const std::string &path) const
{
    const auto it = units.find(path);
    return it == units.end() ? nullptr : &it->second;
}

size_t ArchitectureSnapshot::typeCount() const
{
    size_t count = 0;
    for (const auto &[path, unit] : units) {
        count += unit.types.size();
    }
    return count;
}

size_t ArchitectureSnapshot::implCount() const
{
    size_t count = 0;
    for (const auto &[path, unit] : units) {
        count += unit.impls.size();
    }
    return count;
}

size_t ArchitectureSnapshot::unresolvedCallCount() const
{
    size_t count = 0;
    for (const auto &[path, unit] : units) {
        for (const auto &impl : unit.impls) {
            for (const auto &method : impl.methods) {
                for (const auto &call : method.calls) {
                    if (!call.target.has_value()) {
                        ++count;
                    }
                }
            }
        }
    }
    return count;
}

bool sameContent(const ArchitectureSnapshot &a, const ArchitectureSnapshot &b)
{
    return a.units == b.units;
}

void rebuildRegistry(ArchitectureSnapshot &snapshot)
{
    snapshot.registry.clear();
    snapshot.duplicates.clear();
    snapshot.excludedNames.clear();

    std::map<std::string, std::vector<SourceLocation>> definitions;
    for (const auto &[path, unit] : snapshot.units) {
        for (const auto &type : unit.types) {
            SourceLocation location = type.location;
            if (location.file.empty()) {
                location.file = path;
            }
            definitions[type.qualifiedName].push_back(location);
        }
    }

    for (const auto &[name, locations] : definitions) {
        if (locations.size() == 1) {
            snapshot.registry.emplace(name, locations.front().file);
            continue;
        }
        snapshot.excludedNames.insert(name);
        for (size_t i = 1; i < locations.size(); ++i) {
            snapshot.duplicates.emplace_back(name, locations.front(), locations[i]);
        }
    }
}

} // namespace archscope
