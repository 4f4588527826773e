#pragma once

#include <string>

#include <QString>

#include "common/snapshot.hpp"

namespace archscope {

// SnapshotStore persists an ArchitectureSnapshot as a directory of JSON
// artifacts, one per source file: <directory>/<source path>.arch.json.
// Output is byte-identical for semantically identical snapshots.
class SnapshotStore {
public:
    explicit SnapshotStore(QString directory);

    const QString &directory() const { return m_directory; }

    // Replaces every artifact in the directory. Throws ArchscopeError when
    // the directory or a file cannot be written.
    void write(const ArchitectureSnapshot &snapshot) const;

    // Inverse of write(). The registry is rebuilt from the units read.
    // Throws SnapshotReadError on a missing directory or a malformed artifact.
    ArchitectureSnapshot read() const;

    bool exists() const;

    static QString artifactPathFor(const std::string &sourcePath);

private:
    void removeStaleArtifacts() const;

    QString m_directory;
};

} // namespace archscope
