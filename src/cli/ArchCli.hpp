#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/enums.hpp"
#include "common/snapshot.hpp"

namespace archscope {

struct ExtractionResult;

class ArchCli
{
public:
    // Parses the subcommand and its options, returns the process exit code.
    int run(int argc, char *argv[]);

private:
    int runArchitecture(const QStringList &args);
    int runDiff(const QStringList &args);
    int runDiagram(const QStringList &args);
    int runView(const QStringList &args);
    // connections, state_diagram, class_diagram and er_diagram share one
    // path; the view_* variants render the result as well.
    int runProjectDiagram(const QStringList &args, DiagramMode mode, const QString &name,
                          bool render);

    // Stored snapshot of the working directory when present, otherwise a
    // fresh extraction.
    std::optional<ArchitectureSnapshot> projectSnapshot();
    int writeDiagram(const ArchitectureSnapshot &snapshot, DiagramMode mode,
                     const QString &name, const QString &format);
    int renderImage(const QString &markupPath, const QString &name, const QString &format);
    void reportExtraction(const ExtractionResult &result) const;

    ArchscopeConfig m_config;
};

} // namespace archscope
