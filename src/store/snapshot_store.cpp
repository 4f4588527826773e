#include "store/snapshot_store.hpp"

#include <utility>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace archscope {

namespace {

const QString kArtifactSuffix = QStringLiteral(".arch.json");

// Artifacts must stay inside the output directory.
bool isSafeRelativePath(const std::string &path)
{
    if (path.empty() || path.front() == '/') {
        return false;
    }
    size_t start = 0;
    while (start <= path.size()) {
        const size_t slash = path.find('/', start);
        const std::string component = path.substr(
            start, slash == std::string::npos ? std::string::npos : slash - start);
        if (component == "..") {
            return false;
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return true;
}

QStringList listArtifacts(const QString &directory)
{
    QStringList files;
    QDirIterator it(directory, {QStringLiteral("*") + kArtifactSuffix}, QDir::Files,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files << it.next();
    }
    files.sort();
    return files;
}

} // namespace

SnapshotStore::SnapshotStore(QString directory)
    : m_directory(std::move(directory))
{
}

QString SnapshotStore::artifactPathFor(const std::string &sourcePath)
{
    return QString::fromStdString(sourcePath) + kArtifactSuffix;
}

bool SnapshotStore::exists() const
{
    return QFileInfo(m_directory).isDir();
}

void SnapshotStore::removeStaleArtifacts() const
{
    for (const QString &path : listArtifacts(m_directory)) {
        if (!QFile::remove(path)) {
            throw ArchscopeError("cannot remove stale artifact " + path.toStdString());
        }
    }
}

void SnapshotStore::write(const ArchitectureSnapshot &snapshot) const
{
    // Every path is checked before anything on disk changes, so a rejected
    // snapshot leaves the previous artifacts in place.
    for (const auto &[path, unit] : snapshot.units) {
        if (!isSafeRelativePath(path)) {
            throw ArchscopeError("refusing to write artifact for unsafe path " + path);
        }
    }

    QDir dir(m_directory);
    if (!dir.mkpath(QStringLiteral("."))) {
        throw ArchscopeError("cannot create snapshot directory " + m_directory.toStdString());
    }
    removeStaleArtifacts();

    for (const auto &[path, unit] : snapshot.units) {
        SourceUnit canonical = unit;
        canonicalize(canonical);

        const QString artifact = dir.filePath(artifactPathFor(path));
        if (!QFileInfo(artifact).dir().mkpath(QStringLiteral("."))) {
            throw ArchscopeError("cannot create directory for " + artifact.toStdString());
        }
        QFile file(artifact);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            throw ArchscopeError("cannot write artifact " + artifact.toStdString());
        }
        const nlohmann::json j = canonical;
        const std::string text = j.dump(2) + "\n";
        if (file.write(text.data(), static_cast<qint64>(text.size()))
            != static_cast<qint64>(text.size())) {
            throw ArchscopeError("short write to artifact " + artifact.toStdString());
        }
    }

    ALOG_INFO(QStringLiteral("SnapshotStore"),
              QStringLiteral("write"),
              QStringLiteral("snapshot_written"),
              QStringLiteral("store_requested"),
              QStringLiteral("json_artifacts"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"directory", m_directory.toStdString()},
                              {"units", snapshot.units.size()}}));
}

ArchitectureSnapshot SnapshotStore::read() const
{
    if (!exists()) {
        throw SnapshotReadError(m_directory.toStdString(), "snapshot directory does not exist");
    }

    ArchitectureSnapshot snapshot;
    for (const QString &path : listArtifacts(m_directory)) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw SnapshotReadError(path.toStdString(), "cannot open artifact");
        }
        const QByteArray data = file.readAll();

        SourceUnit unit;
        try {
            unit = nlohmann::json::parse(data.toStdString()).get<SourceUnit>();
        } catch (const nlohmann::json::exception &ex) {
            throw SnapshotReadError(path.toStdString(), ex.what());
        }
        if (snapshot.units.contains(unit.path)) {
            throw SnapshotReadError(path.toStdString(), "duplicate unit path " + unit.path);
        }
        const std::string unitPath = unit.path;
        snapshot.units.emplace(unitPath, std::move(unit));
    }
    rebuildRegistry(snapshot);

    ALOG_DEBUG(QStringLiteral("SnapshotStore"),
               QStringLiteral("read"),
               QStringLiteral("snapshot_read"),
               QStringLiteral("load_requested"),
               QStringLiteral("json_artifacts"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"directory", m_directory.toStdString()},
                               {"units", snapshot.units.size()},
                               {"duplicates", snapshot.duplicates.size()}}));
    return snapshot;
}

} // namespace archscope
