#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <vector>

#include "common/config.hpp"
#include "common/errors.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();

    void testDefaults();
    void testFromJson();
    void testWrongTypesRejected();
    void testRangeChecks();
    void testEnvironmentOverrides();
    void testLoadFromWorkingDirectory();
    void testMissingExplicitPath();
    void testMalformedFile();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_prevCwd;

    QString writeFile(const QString &name, const QByteArray &content);
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    m_prevCwd = QDir::currentPath();
}

void ConfigTests::cleanupTestCase()
{
    QDir::setCurrent(m_prevCwd);
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::cleanup()
{
    qunsetenv("ARCHSCOPE_RENDERER");
    qunsetenv("ARCHSCOPE_RENDER_TIMEOUT_MS");
    qunsetenv("ARCHSCOPE_WORKERS");
    qunsetenv("ARCHSCOPE_TRACE");
}

QString ConfigTests::writeFile(const QString &name, const QByteArray &content)
{
    const QString path = m_tempDir.filePath(name);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void ConfigTests::testDefaults()
{
    const archscope::ArchscopeConfig config;
    QCOMPARE(QString::fromStdString(config.architectureDir), QStringLiteral("architecture"));
    QCOMPARE(QString::fromStdString(config.diagramsDir), QStringLiteral("diagrams"));
    QCOMPARE(QString::fromStdString(config.visualsDir), QStringLiteral("visuals"));
    QCOMPARE(QString::fromStdString(config.renderer.program), QStringLiteral("mmdc"));
    QCOMPARE(config.renderer.timeoutMs, 60000);
    QVERIFY(!config.strictDuplicates);

    QVERIFY(config.isExcludedDir("target"));
    QVERIFY(config.isExcludedDir(".git"));
    QVERIFY(!config.isExcludedDir("src"));
    QVERIFY(config.isExcludedPath("target"));
    QVERIFY(config.isExcludedPath("crates/core/target"));
    QVERIFY(config.isExcludedPath("diagrams"));
    QVERIFY(config.isExcludedPath("./architecture"));
    QVERIFY(!config.isExcludedPath("src/diagrams"));
    QVERIFY(!config.isExcludedPath("src/visuals/widgets"));
    QVERIFY(!config.trace);
    QVERIFY(config.hasSourceExtension("lib.rs"));
    QVERIFY(!config.hasSourceExtension("lib.rs.arch.json"));
    QVERIFY(!config.hasSourceExtension("rs"));
}

void ConfigTests::testFromJson()
{
    const auto config = archscope::configFromJson(nlohmann::json{
        {"diagramsDir", "out/diagrams"},
        {"excludeDirs", nlohmann::json::array({"vendor"})},
        {"workerThreads", 2},
        {"strictDuplicates", true},
        {"trace", true},
        {"renderer", {{"program", "/opt/mmdc"}, {"timeoutMs", 500}, {"cssFile", "theme.css"}}},
    });
    QCOMPARE(QString::fromStdString(config.diagramsDir), QStringLiteral("out/diagrams"));
    QCOMPARE(QString::fromStdString(config.visualsDir), QStringLiteral("visuals"));
    QVERIFY(config.isExcludedDir("vendor"));
    QVERIFY(!config.isExcludedDir("target"));
    QCOMPARE(config.workerThreads, 2);
    QVERIFY(config.strictDuplicates);
    QVERIFY(config.trace);
    QVERIFY(config.isExcludedPath("out/diagrams"));
    QVERIFY(!config.isExcludedPath("diagrams"));
    QCOMPARE(QString::fromStdString(config.renderer.program), QStringLiteral("/opt/mmdc"));
    QCOMPARE(config.renderer.timeoutMs, 500);
    QCOMPARE(QString::fromStdString(config.renderer.cssFile), QStringLiteral("theme.css"));
}

void ConfigTests::testWrongTypesRejected()
{
    const std::vector<nlohmann::json> invalid = {
        nlohmann::json::array({1, 2}),
        nlohmann::json{{"extensions", ".rs"}},
        nlohmann::json{{"excludeDirs", nlohmann::json::array({1})}},
        nlohmann::json{{"diagramsDir", 7}},
        nlohmann::json{{"renderer", "mmdc"}},
        nlohmann::json{{"renderer", {{"timeoutMs", "fast"}}}},
    };
    for (const auto &j : invalid) {
        try {
            archscope::configFromJson(j);
            QFAIL(qPrintable(QStringLiteral("expected ConfigError for %1")
                                 .arg(QString::fromStdString(j.dump()))));
        } catch (const archscope::ConfigError &) {
        }
    }
}

void ConfigTests::testRangeChecks()
{
    try {
        archscope::configFromJson(nlohmann::json{{"workerThreads", -1}});
        QFAIL("expected ConfigError");
    } catch (const archscope::ConfigError &error) {
        QVERIFY(QString::fromUtf8(error.what()).contains(QStringLiteral("workerThreads")));
    }
    try {
        archscope::configFromJson(nlohmann::json{{"renderer", {{"timeoutMs", 0}}}});
        QFAIL("expected ConfigError");
    } catch (const archscope::ConfigError &error) {
        QVERIFY(QString::fromUtf8(error.what()).contains(QStringLiteral("timeoutMs")));
    }
}

void ConfigTests::testEnvironmentOverrides()
{
    qputenv("ARCHSCOPE_RENDERER", "/usr/local/bin/mmdc");
    qputenv("ARCHSCOPE_RENDER_TIMEOUT_MS", "1500");
    qputenv("ARCHSCOPE_WORKERS", "3");
    qputenv("ARCHSCOPE_TRACE", "1");

    archscope::ArchscopeConfig config;
    archscope::applyEnvironmentOverrides(config);
    QCOMPARE(QString::fromStdString(config.renderer.program), QStringLiteral("/usr/local/bin/mmdc"));
    QCOMPARE(config.renderer.timeoutMs, 1500);
    QCOMPARE(config.workerThreads, 3);
    QVERIFY(config.trace);

    // Values that do not parse leave the setting alone.
    qputenv("ARCHSCOPE_RENDER_TIMEOUT_MS", "soon");
    archscope::ArchscopeConfig untouched;
    archscope::applyEnvironmentOverrides(untouched);
    QCOMPARE(untouched.renderer.timeoutMs, 60000);
}

void ConfigTests::testLoadFromWorkingDirectory()
{
    const QString project = m_tempDir.filePath(QStringLiteral("project"));
    writeFile(QStringLiteral("project/archscope.json"), "{ \"visualsDir\": \"images\" }\n");
    QVERIFY(QDir::setCurrent(project));

    const auto config = archscope::loadConfig();
    QCOMPARE(QString::fromStdString(config.visualsDir), QStringLiteral("images"));

    QVERIFY(QDir::setCurrent(m_tempDir.path()));
    const auto defaults = archscope::loadConfig();
    QCOMPARE(QString::fromStdString(defaults.visualsDir), QStringLiteral("visuals"));
}

void ConfigTests::testMissingExplicitPath()
{
    try {
        archscope::loadConfig(m_tempDir.filePath(QStringLiteral("absent.json")));
        QFAIL("expected ConfigError");
    } catch (const archscope::ConfigError &error) {
        QVERIFY(QString::fromUtf8(error.what()).contains(QStringLiteral("absent.json")));
    }
}

void ConfigTests::testMalformedFile()
{
    const QString path = writeFile(QStringLiteral("broken.json"), "{ \"diagramsDir\": ");
    try {
        archscope::loadConfig(path);
        QFAIL("expected ConfigError");
    } catch (const archscope::ConfigError &error) {
        QVERIFY(QString::fromUtf8(error.what()).contains(QStringLiteral("malformed")));
    }
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
