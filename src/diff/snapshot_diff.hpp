#pragma once

#include <map>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "common/snapshot.hpp"

namespace archscope {

/**
 * Structural value of every type in a snapshot, keyed by qualified name:
 * kind, visibility, fields, implemented traits and the signatures of all
 * methods whose impl block resolves to the type. Inherent methods are keyed
 * by name, trait methods by "Trait::name". Source locations are left out.
 *
 * When a name is defined twice the first definition (by file path) wins.
 */
std::map<std::string, nlohmann::json> structuralView(const ArchitectureSnapshot &snapshot);

// Classifies every type (and, with DiffGranularity::Method, every method of
// a type present on both sides) as added, removed, modified or unchanged.
ArchitectureDiff diffSnapshots(const ArchitectureSnapshot &before,
                               const ArchitectureSnapshot &after,
                               DiffGranularity granularity = DiffGranularity::Type);

// Each directory may be a snapshot directory or a project directory that
// contains architecture/. Throws DiffIncompatibleError when either side
// cannot be read back or holds no artifacts.
ArchitectureDiff diffDirectories(const QString &directoryA,
                                 const QString &directoryB,
                                 DiffGranularity granularity = DiffGranularity::Type);

QString snapshotDirectoryFor(const QString &directory);

} // namespace archscope
