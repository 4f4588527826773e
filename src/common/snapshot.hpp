#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace archscope {

// Complete extracted architecture of one source tree. The registry, the
// duplicate list and the excluded names are derived from the units by
// rebuildRegistry() and are never edited directly.
struct ArchitectureSnapshot {
    std::map<std::string, SourceUnit> units;

    // Qualified type name -> owning file path. Duplicate names are absent.
    std::map<std::string, std::string> registry;
    std::vector<DuplicateTypeError> duplicates;
    std::set<std::string> excludedNames;

    const TypeDefinition *findType(const std::string &qualifiedName) const;
    const SourceUnit *findUnit(const std::string &path) const;

    size_t typeCount() const;
    size_t implCount() const;
    size_t unresolvedCallCount() const;
};

// Structural equality of the extracted content only; derived state is ignored.
bool sameContent(const ArchitectureSnapshot &a, const ArchitectureSnapshot &b);

// Second extraction phase: run after every unit is known, never incrementally,
// so duplicate detection does not depend on the order files were processed.
void rebuildRegistry(ArchitectureSnapshot &snapshot);

} // namespace archscope
