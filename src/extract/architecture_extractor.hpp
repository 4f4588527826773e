#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/snapshot.hpp"

namespace archscope {

struct ExtractionResult {
    ArchitectureSnapshot snapshot;
    // Files that could not be scanned; they are absent from the snapshot.
    std::vector<ScanError> skipped;

    const std::vector<DuplicateTypeError> &duplicates() const
    {
        return snapshot.duplicates;
    }
};

// "src/a/mod.rs" -> "crate::a", "src/lib.rs" -> "crate".
std::string modulePathForFile(const std::string &relativePath);

// Builds the unit for one file. `filePath` is relative to the scanned root
// and becomes the unit's identity. Throws ScanError naming the file.
SourceUnit extract(const std::string &filePath, const std::string &text);

/**
 * Extract every source file below `root` (or `root` itself when it is a
 * file) on a worker pool, then build the qualified-name registry and
 * resolve call targets once all files are in.
 *
 * Files that fail to scan are reported in `skipped`; duplicate type names
 * are reported in the snapshot and excluded from the registry.
 */
ExtractionResult extractTree(const QString &root,
                             const ArchscopeConfig &config = ArchscopeConfig());

} // namespace archscope
