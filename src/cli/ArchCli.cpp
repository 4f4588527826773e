#include "cli/ArchCli.hpp"

#include <iostream>
#include <sstream>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "diff/snapshot_diff.hpp"
#include "extract/architecture_extractor.hpp"
#include "graph/diagram_renderer.hpp"
#include "graph/markup_lint.hpp"
#include "graph/relationship_graph.hpp"
#include "render/image_renderer.hpp"
#include "store/snapshot_store.hpp"

namespace archscope {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  archscope architecture [DIR] [--output PATH]\n"
        "  archscope diff DIR1 DIR2 [--format markdown|json] [--methods] [--out PATH]\n"
        "  archscope diagram TARGET [--format svg|png|pdf]\n"
        "  archscope view TARGET [--format svg|png|pdf]\n"
        "  archscope connections | state_diagram | class_diagram | er_diagram\n"
        "  archscope view_class_diagram | view_connections [--format svg|png|pdf]\n"
        "Options: --config PATH, --strict, --trace\n");
}

const QStringList kValueOptions = {
    QStringLiteral("--output"),
    QStringLiteral("--format"),
    QStringLiteral("--out"),
    QStringLiteral("--config"),
};

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

bool hasFlag(const QStringList &args, const QString &flag)
{
    return args.contains(flag);
}

// Arguments after the subcommand that are neither options nor option values.
QStringList positionalArgs(const QStringList &args)
{
    QStringList result;
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (kValueOptions.contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("--"))) {
            continue;
        }
        result << arg;
    }
    return result;
}

std::string formatJsonValue(const nlohmann::json &value)
{
    if (value.is_null()) {
        return "(none)";
    }
    if (value.is_string()) {
        return "`" + value.get<std::string>() + "`";
    }
    return "`" + value.dump() + "`";
}

void renderDiffMarkdown(const ArchitectureDiff &diff, std::ostream &out)
{
    out << "# Architecture Diff Report\n\n";
    out << "From: " << diff.snapshotAId << "\n";
    out << "To:   " << diff.snapshotBId << "\n";
    out << "Granularity: "
        << (diff.granularity == DiffGranularity::Method ? "method" : "type") << "\n\n";
    out << "Added: " << diff.added.size() << ", Removed: " << diff.removed.size()
        << ", Modified: " << diff.modified.size() << ", Unchanged: " << diff.unchanged.size()
        << "\n\n";

    if (diff.isEmpty()) {
        out << "No architectural differences.\n";
        return;
    }

    if (!diff.added.empty()) {
        out << "## Added\n\n";
        for (const auto &[identity, value] : diff.added) {
            out << "- `" << identity << "`";
            if (value.is_object() && value.contains("kind")) {
                out << " (" << value.at("kind").get<std::string>() << ")";
            }
            out << "\n";
        }
        out << "\n";
    }

    if (!diff.removed.empty()) {
        out << "## Removed\n\n";
        for (const auto &[identity, value] : diff.removed) {
            out << "- `" << identity << "`";
            if (value.is_object() && value.contains("kind")) {
                out << " (" << value.at("kind").get<std::string>() << ")";
            }
            out << "\n";
        }
        out << "\n";
    }

    if (!diff.modified.empty()) {
        out << "## Modified\n\n";
        for (const auto &[identity, modification] : diff.modified) {
            out << "### `" << identity << "`\n\n";
            for (const auto &field : modification.changedFields) {
                out << "- " << field.path << ": " << formatJsonValue(field.before) << " -> "
                    << formatJsonValue(field.after) << "\n";
            }
            out << "\n";
        }
    }
}

void renderDiffJson(const ArchitectureDiff &diff, std::ostream &out)
{
    nlohmann::json payload;
    payload["diff"] = diff;
    payload["summary"] = {
        {"added", diff.added.size()},
        {"removed", diff.removed.size()},
        {"modified", diff.modified.size()},
        {"unchanged", diff.unchanged.size()},
    };
    out << payload.dump(2) << std::endl;
}

bool writeTextFile(const QString &path, const std::string &text)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(text);
    return file.write(data) == data.size();
}

std::optional<DiagramMode> modeFromMarkup(const QString &markup)
{
    const QStringList lines = markup.split(QLatin1Char('\n'));
    for (const QString &raw : lines) {
        const QString line = raw.trimmed();
        if (line.isEmpty() || line.startsWith(QStringLiteral("%%"))) {
            continue;
        }
        for (const DiagramMode mode : {DiagramMode::Class, DiagramMode::State,
                                       DiagramMode::Connections, DiagramMode::Entity}) {
            if (line.toStdString() == diagramHeader(mode)) {
                return mode;
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

QString diagramStem(const QString &target)
{
    const QFileInfo info(target);
    if (info.isDir()) {
        const QString name = QDir(info.absoluteFilePath()).dirName();
        return name.isEmpty() ? QStringLiteral("root") : name;
    }
    return info.completeBaseName();
}

} // namespace

int ArchCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    // --trace is global and may appear anywhere.
    const bool traceFlag = args.removeAll(QStringLiteral("--trace")) > 0;
    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        m_config = loadConfig(getArgValue(args, QStringLiteral("--config")));
    } catch (const ConfigError &error) {
        std::cerr << error.what() << std::endl;
        return 1;
    }
    if (hasFlag(args, QStringLiteral("--strict"))) {
        m_config.strictDuplicates = true;
    }
    if (traceFlag) {
        m_config.trace = true;
    }
    if (m_config.trace && !logging::isTraceEnabled()) {
        logging::initLogging(logging::defaultProcessName(), true);
    }

    const QString command = args.at(1);
    ALOG_INFO(QStringLiteral("ArchCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("architecture")) {
            return runArchitecture(args);
        }
        if (command == QStringLiteral("diff")) {
            return runDiff(args);
        }
        if (command == QStringLiteral("diagram")) {
            return runDiagram(args);
        }
        if (command == QStringLiteral("view")) {
            return runView(args);
        }
        if (command == QStringLiteral("connections")) {
            return runProjectDiagram(args, DiagramMode::Connections, command, false);
        }
        if (command == QStringLiteral("state_diagram")) {
            return runProjectDiagram(args, DiagramMode::State, command, false);
        }
        if (command == QStringLiteral("class_diagram")) {
            return runProjectDiagram(args, DiagramMode::Class, command, false);
        }
        if (command == QStringLiteral("er_diagram")) {
            return runProjectDiagram(args, DiagramMode::Entity, command, false);
        }
        if (command == QStringLiteral("view_class_diagram")) {
            return runProjectDiagram(args, DiagramMode::Class, QStringLiteral("class_diagram"),
                                     true);
        }
        if (command == QStringLiteral("view_connections")) {
            return runProjectDiagram(args, DiagramMode::Connections,
                                     QStringLiteral("connections"), true);
        }
    } catch (const ArchscopeError &error) {
        ALOG_ERROR(QStringLiteral("ArchCli"),
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   QStringLiteral("operation_error"),
                   QStringLiteral("cli"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"error", error.what()}}));
        std::cerr << "error: " << error.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

void ArchCli::reportExtraction(const ExtractionResult &result) const
{
    for (const auto &skipped : result.skipped) {
        std::cerr << "skipped " << skipped.file() << ":" << skipped.line() << ": "
                  << skipped.reason() << std::endl;
    }
    for (const auto &duplicate : result.duplicates()) {
        std::cerr << "excluded " << duplicate.what() << std::endl;
    }
}

int ArchCli::runArchitecture(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    const QString root = positional.isEmpty() ? QStringLiteral(".") : positional.first();
    QString output = getArgValue(args, QStringLiteral("--output"));
    if (output.isEmpty()) {
        output = QDir(root).filePath(QString::fromStdString(m_config.architectureDir));
    }

    const ExtractionResult result = extractTree(root, m_config);
    reportExtraction(result);

    const SnapshotStore store(output);
    store.write(result.snapshot);

    ALOG_INFO(QStringLiteral("ArchCli"),
              QStringLiteral("runArchitecture"),
              QStringLiteral("architecture_written"),
              QStringLiteral("user_invocation"),
              QStringLiteral("extract_and_store"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", root.toStdString()},
                              {"output", output.toStdString()},
                              {"units", result.snapshot.units.size()},
                              {"skipped", result.skipped.size()}}));
    std::cout << "Wrote " << result.snapshot.units.size() << " source units ("
              << result.snapshot.typeCount() << " types, " << result.snapshot.implCount()
              << " impl blocks) to " << output.toStdString() << std::endl;
    return 0;
}

int ArchCli::runDiff(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.size() != 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    QString format = getArgValue(args, QStringLiteral("--format")).toLower();
    if (format.isEmpty()) {
        format = QStringLiteral("markdown");
    }
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }
    const DiffGranularity granularity = hasFlag(args, QStringLiteral("--methods"))
        ? DiffGranularity::Method
        : DiffGranularity::Type;

    const ArchitectureDiff diff = diffDirectories(positional.at(0), positional.at(1), granularity);

    ALOG_INFO(QStringLiteral("ArchCli"),
              QStringLiteral("runDiff"),
              QStringLiteral("diff_report"),
              QStringLiteral("user_invocation"),
              QStringLiteral("snapshot_compare"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"a", diff.snapshotAId},
                              {"b", diff.snapshotBId},
                              {"format", format.toStdString()}}));

    std::ostringstream report;
    if (format == QStringLiteral("json")) {
        renderDiffJson(diff, report);
    } else {
        renderDiffMarkdown(diff, report);
    }

    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        std::cout << report.str();
        return 0;
    }
    if (!writeTextFile(outPath, report.str())) {
        std::cerr << "Failed to write " << outPath.toStdString() << std::endl;
        return 1;
    }
    std::cout << "Wrote " << outPath.toStdString() << std::endl;
    return 0;
}

int ArchCli::runDiagram(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString target = positional.first();
    const ExtractionResult result = extractTree(target, m_config);
    reportExtraction(result);
    return writeDiagram(result.snapshot, DiagramMode::Class, diagramStem(target),
                        getArgValue(args, QStringLiteral("--format")).toLower());
}

int ArchCli::runView(const QStringList &args)
{
    const QStringList positional = positionalArgs(args);
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString target = positional.first();
    QString markupPath = target;
    if (!QFileInfo(markupPath).isFile()) {
        markupPath = QDir(QString::fromStdString(m_config.diagramsDir))
                         .filePath(target + QStringLiteral(".mermaid"));
    }
    if (!QFileInfo(markupPath).isFile()) {
        std::cerr << "No diagram at " << markupPath.toStdString()
                  << "; generate it with 'archscope diagram " << target.toStdString() << "'"
                  << std::endl;
        return 1;
    }

    QString format = getArgValue(args, QStringLiteral("--format")).toLower();
    if (format.isEmpty()) {
        format = QStringLiteral("svg");
    }
    return renderImage(markupPath, QFileInfo(markupPath).completeBaseName(), format);
}

int ArchCli::runProjectDiagram(const QStringList &args, DiagramMode mode, const QString &name,
                               bool render)
{
    const auto snapshot = projectSnapshot();
    if (!snapshot.has_value()) {
        return 1;
    }
    QString format = getArgValue(args, QStringLiteral("--format")).toLower();
    if (render && format.isEmpty()) {
        format = QStringLiteral("svg");
    }
    return writeDiagram(*snapshot, mode, name, format);
}

std::optional<ArchitectureSnapshot> ArchCli::projectSnapshot()
{
    const SnapshotStore store(QString::fromStdString(m_config.architectureDir));
    if (store.exists()) {
        try {
            return store.read();
        } catch (const SnapshotReadError &error) {
            std::cerr << "Cannot read stored architecture: " << error.what() << std::endl;
            return std::nullopt;
        }
    }
    ExtractionResult result = extractTree(QStringLiteral("."), m_config);
    reportExtraction(result);
    return std::move(result.snapshot);
}

int ArchCli::writeDiagram(const ArchitectureSnapshot &snapshot, DiagramMode mode,
                          const QString &name, const QString &format)
{
    GraphOptions options;
    options.strictDuplicates = m_config.strictDuplicates;
    const GraphBuildResult built = buildGraph(snapshot, options);
    for (const auto &diagnostic : built.diagnostics) {
        std::cerr << diagnostic << std::endl;
    }
    if (built.unresolvedCalls > 0) {
        std::cerr << built.unresolvedCalls
                  << " call sites did not resolve to a known type and were left out" << std::endl;
    }

    const std::string markup = renderDiagram(built.graph, mode);
    const QString markupPath = QDir(QString::fromStdString(m_config.diagramsDir))
                                   .filePath(name + QStringLiteral(".mermaid"));
    if (!writeTextFile(markupPath, markup)) {
        std::cerr << "Failed to write " << markupPath.toStdString() << std::endl;
        return 1;
    }

    ALOG_INFO(QStringLiteral("ArchCli"),
              QStringLiteral("writeDiagram"),
              QStringLiteral("diagram_written"),
              QStringLiteral("user_invocation"),
              QStringLiteral("mermaid"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"mode", toDiagramModeString(mode)},
                              {"path", markupPath.toStdString()},
                              {"nodes", built.graph.nodes().size()},
                              {"edges", built.graph.edges().size()}}));
    std::cout << "Wrote " << markupPath.toStdString() << std::endl;

    if (format.isEmpty()) {
        return 0;
    }
    return renderImage(markupPath, name, format);
}

int ArchCli::renderImage(const QString &markupPath, const QString &name, const QString &format)
{
    if (!ImageRenderer::isSupportedFormat(format)) {
        std::cerr << "Invalid format. Use svg, png or pdf." << std::endl;
        return 1;
    }
    QFile file(markupPath);
    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "Cannot read " << markupPath.toStdString() << std::endl;
        return 1;
    }
    const QString markup = QString::fromUtf8(file.readAll());
    const DiagramMode mode = modeFromMarkup(markup).value_or(DiagramMode::Class);

    const ImageRenderer renderer(m_config.renderer, QString::fromStdString(m_config.visualsDir));
    const RenderOutcome outcome = renderer.render(markup.toStdString(), name, format, mode);
    if (!outcome.ok) {
        std::cerr << "Rendering failed: " << outcome.error.toStdString() << std::endl;
        return 1;
    }
    std::cout << "Rendered " << outcome.outputPath.toStdString() << std::endl;
    return 0;
}

} // namespace archscope
