#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <iostream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli/ArchCli.hpp"
#include "common/logging.hpp"

namespace {

const QByteArray kWidgetSource = R"(
pub struct Widget { width: u32 }
impl Widget {
    pub fn new() -> Self { Widget { width: 0 } }
}
)";

const QByteArray kFactorySource = R"(
use crate::a::Widget;
pub struct Factory { made: Vec<Widget> }
impl Factory {
    pub fn make(&mut self) -> Widget { Widget::new() }
}
)";

} // namespace

class ArchCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testArchitectureWritesArtifacts();
    void testDiffJson();
    void testDiffMarkdownToFile();
    void testDiffRejectsBadArguments();
    void testProjectDiagrams();
    void testDiagramForSingleFile();
    void testViewMissingDiagram();
    void testViewRendersWithRenderer();
    void testViewReportsRendererFailure();
    void testUnknownCommand();
    void testMissingConfigFile();
    void testTraceFlagAnywhere();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_prevCwd;

    QString projectPath(const QString &name) const;
    void writeFile(const QString &path, const QByteArray &content);
    int runCli(const QStringList &args, std::string &out);
};

void ArchCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    m_prevCwd = QDir::currentPath();

    writeFile(projectPath("before") + "/src/a.rs", kWidgetSource);
    writeFile(projectPath("before") + "/src/b.rs", kFactorySource);
    writeFile(projectPath("after") + "/src/a.rs",
              kWidgetSource + "impl Widget { pub fn reset(&mut self) {} }\n");
}

void ArchCliTests::cleanupTestCase()
{
    QDir::setCurrent(m_prevCwd);
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ArchCliTests::init()
{
    QVERIFY(QDir::setCurrent(projectPath("before")));
}

void ArchCliTests::cleanup()
{
    qunsetenv("ARCHSCOPE_RENDERER");
}

QString ArchCliTests::projectPath(const QString &name) const
{
    return m_tempDir.filePath(name);
}

void ArchCliTests::writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
    file.close();
}

int ArchCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    archscope::ArchCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ArchCliTests::testArchitectureWritesArtifacts()
{
    std::string output;
    QCOMPARE(runCli({"archscope", "architecture"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Wrote 2 source units")));
    QVERIFY(QFile::exists(projectPath("before") + "/architecture/src/a.rs.arch.json"));
    QVERIFY(QFile::exists(projectPath("before") + "/architecture/src/b.rs.arch.json"));

    QCOMPARE(runCli({"archscope", "architecture", projectPath("after")}, output), 0);
    QVERIFY(QFile::exists(projectPath("after") + "/architecture/src/a.rs.arch.json"));
}

void ArchCliTests::testDiffJson()
{
    std::string output;
    const int code = runCli({"archscope", "diff", projectPath("before"), projectPath("after"),
                             "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.contains("diff"));
    QVERIFY(parsed.at("diff").at("modified").contains("crate::a::Widget"));
    QVERIFY(parsed.at("diff").at("removed").contains("crate::b::Factory"));
    QCOMPARE(parsed.at("summary").at("modified").get<int>(), 1);
    QCOMPARE(parsed.at("summary").at("removed").get<int>(), 1);
}

void ArchCliTests::testDiffMarkdownToFile()
{
    const QString reportPath = m_tempDir.filePath("reports/diff.md");
    std::string output;
    const int code = runCli({"archscope", "diff", projectPath("before"), projectPath("after"),
                             "--out", reportPath}, output);
    QCOMPARE(code, 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Wrote")));

    QFile report(reportPath);
    QVERIFY(report.open(QIODevice::ReadOnly));
    const QString text = QString::fromUtf8(report.readAll());
    QVERIFY(text.startsWith(QStringLiteral("# Architecture Diff Report")));
    QVERIFY(text.contains(QStringLiteral("## Modified")));
    QVERIFY(text.contains(QStringLiteral("methods.reset")));
}

void ArchCliTests::testDiffRejectsBadArguments()
{
    std::string output;
    QCOMPARE(runCli({"archscope", "diff", projectPath("before")}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Usage")));

    QCOMPARE(runCli({"archscope", "diff", projectPath("before"), projectPath("after"),
                     "--format", "yaml"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Invalid format")));

    QCOMPARE(runCli({"archscope", "diff", projectPath("before"), m_tempDir.filePath("empty")},
                    output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("error:")));
}

void ArchCliTests::testProjectDiagrams()
{
    const QList<QPair<QString, QString>> expected = {
        {QStringLiteral("class_diagram"), QStringLiteral("classDiagram")},
        {QStringLiteral("connections"), QStringLiteral("graph LR")},
        {QStringLiteral("state_diagram"), QStringLiteral("stateDiagram-v2")},
        {QStringLiteral("er_diagram"), QStringLiteral("erDiagram")},
    };
    for (const auto &[command, header] : expected) {
        std::string output;
        QCOMPARE(runCli({"archscope", command}, output), 0);

        QFile diagram(projectPath("before") + "/diagrams/" + command + ".mermaid");
        QVERIFY(diagram.open(QIODevice::ReadOnly));
        const QString markup = QString::fromUtf8(diagram.readAll());
        QVERIFY(markup.startsWith(header));
    }

    QFile connections(projectPath("before") + "/diagrams/connections.mermaid");
    QVERIFY(connections.open(QIODevice::ReadOnly));
    QVERIFY(connections.readAll().contains("crate_b_Factory -->"));
}

void ArchCliTests::testDiagramForSingleFile()
{
    std::string output;
    QCOMPARE(runCli({"archscope", "diagram", "src/a.rs"}, output), 0);
    QVERIFY(QFile::exists(projectPath("before") + "/diagrams/a.mermaid"));
}

void ArchCliTests::testViewMissingDiagram()
{
    std::string output;
    QCOMPARE(runCli({"archscope", "view", "nothing_here"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("No diagram")));
}

void ArchCliTests::testViewRendersWithRenderer()
{
    const QString script = m_tempDir.filePath("copy-renderer.sh");
    writeFile(script, "#!/bin/sh\ncp \"$2\" \"$4\"\n");
    QFile::setPermissions(script, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    qputenv("ARCHSCOPE_RENDERER", script.toUtf8());

    std::string output;
    QCOMPARE(runCli({"archscope", "view_class_diagram"}, output), 0);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Rendered")));
    QVERIFY(QFile::exists(projectPath("before") + "/visuals/class_diagram.svg"));

    QCOMPARE(runCli({"archscope", "view", "a", "--format", "png"}, output), 0);
    QVERIFY(QFile::exists(projectPath("before") + "/visuals/a.png"));

    QCOMPARE(runCli({"archscope", "view", "a", "--format", "gif"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Invalid format")));
}

void ArchCliTests::testViewReportsRendererFailure()
{
    qputenv("ARCHSCOPE_RENDERER", m_tempDir.filePath("missing-renderer").toUtf8());

    std::string output;
    QCOMPARE(runCli({"archscope", "view_connections"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Rendering failed")));
    // The markup is still written before rendering is attempted.
    QVERIFY(QFile::exists(projectPath("before") + "/diagrams/connections.mermaid"));
}

void ArchCliTests::testUnknownCommand()
{
    std::string output;
    QCOMPARE(runCli({"archscope", "frobnicate"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Usage")));

    QCOMPARE(runCli({"archscope"}, output), 1);
}

void ArchCliTests::testMissingConfigFile()
{
    std::string output;
    QCOMPARE(runCli({"archscope", "class_diagram", "--config", m_tempDir.filePath("absent.json")},
                    output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("absent.json")));
}

void ArchCliTests::testTraceFlagAnywhere()
{
    namespace logging = archscope::logging;
    logging::initLogging(logging::defaultProcessName(), false);
    const QString traceLog = QDir(logging::logsDirPath())
        .filePath(logging::defaultProcessName() + QStringLiteral("-trace.log"));
    QFile::remove(traceLog);

    std::string output;
    QCOMPARE(runCli({"archscope", "--trace", "class_diagram"}, output), 0);
    QVERIFY(logging::isTraceEnabled());
    QVERIFY(QFile::exists(traceLog));
    QVERIFY(QFile::exists(projectPath("before") + "/diagrams/class_diagram.mermaid"));

    logging::initLogging(logging::defaultProcessName(), false);
    QFile::remove(traceLog);
    qputenv("ARCHSCOPE_TRACE", "1");
    QCOMPARE(runCli({"archscope", "class_diagram"}, output), 0);
    qunsetenv("ARCHSCOPE_TRACE");
    QVERIFY(logging::isTraceEnabled());
    QVERIFY(QFile::exists(traceLog));

    logging::initLogging(logging::defaultProcessName(), false);
}

QTEST_MAIN(ArchCliTests)
#include "test_arch_cli.moc"
