#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "render/image_renderer.hpp"

class ImageRendererTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testSupportedFormats();
    void testThemeOnlyForClassDiagrams();
    void testArguments();
    void testRenderWithScript();
    void testRendererFailure();
    void testMissingProgram();
    void testUnsupportedFormat();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeScript(const QString &name, const QByteArray &body);
};

void ImageRendererTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ImageRendererTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString ImageRendererTests::writeScript(const QString &name, const QByteArray &body)
{
    const QString path = m_tempDir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write("#!/bin/sh\n");
    file.write(body);
    file.close();
    file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

void ImageRendererTests::testSupportedFormats()
{
    QVERIFY(archscope::ImageRenderer::isSupportedFormat(QStringLiteral("svg")));
    QVERIFY(archscope::ImageRenderer::isSupportedFormat(QStringLiteral("png")));
    QVERIFY(archscope::ImageRenderer::isSupportedFormat(QStringLiteral("pdf")));
    QVERIFY(!archscope::ImageRenderer::isSupportedFormat(QStringLiteral("gif")));
    QVERIFY(!archscope::ImageRenderer::isSupportedFormat(QStringLiteral("SVG")));
}

void ImageRendererTests::testThemeOnlyForClassDiagrams()
{
    const std::string markup = "classDiagram\n";
    const std::string themed = archscope::ImageRenderer::withTheme(markup, archscope::DiagramMode::Class);
    QVERIFY(themed.rfind("%%{init", 0) == 0);
    QVERIFY(themed.size() > markup.size());
    QVERIFY(themed.compare(themed.size() - markup.size(), markup.size(), markup) == 0);

    const std::string graph = "graph LR\n";
    QCOMPARE(QString::fromStdString(archscope::ImageRenderer::withTheme(graph, archscope::DiagramMode::Connections)),
             QString::fromStdString(graph));
}

void ImageRendererTests::testArguments()
{
    archscope::RendererConfig plain;
    const archscope::ImageRenderer renderer(plain, m_tempDir.filePath(QStringLiteral("visuals")));
    QCOMPARE(renderer.argumentsFor(QStringLiteral("in.mmd"), QStringLiteral("out.svg")),
             QStringList({QStringLiteral("-i"), QStringLiteral("in.mmd"),
                          QStringLiteral("-o"), QStringLiteral("out.svg")}));

    archscope::RendererConfig styled;
    styled.configFile = "mermaid.json";
    styled.cssFile = "theme.css";
    const archscope::ImageRenderer themed(styled, m_tempDir.filePath(QStringLiteral("visuals")));
    const QStringList arguments = themed.argumentsFor(QStringLiteral("in.mmd"), QStringLiteral("out.png"));
    QCOMPARE(arguments.size(), 8);
    QCOMPARE(arguments.at(4), QStringLiteral("--configFile"));
    QCOMPARE(arguments.at(5), QStringLiteral("mermaid.json"));
    QCOMPARE(arguments.at(6), QStringLiteral("--cssFile"));
    QCOMPARE(arguments.at(7), QStringLiteral("theme.css"));
}

void ImageRendererTests::testRenderWithScript()
{
    archscope::RendererConfig config;
    config.program = writeScript(QStringLiteral("copy-renderer.sh"), "cp \"$2\" \"$4\"\n").toStdString();
    config.timeoutMs = 10000;
    const QString visuals = m_tempDir.filePath(QStringLiteral("visuals"));
    const archscope::ImageRenderer renderer(config, visuals);

    const auto outcome = renderer.render("classDiagram\n    class a[\"A\"]\n",
                                         QStringLiteral("class_diagram"),
                                         QStringLiteral("svg"),
                                         archscope::DiagramMode::Class);
    QVERIFY2(outcome.ok, qPrintable(outcome.error));
    QCOMPARE(outcome.outputPath, QDir(visuals).filePath(QStringLiteral("class_diagram.svg")));

    QFile output(outcome.outputPath);
    QVERIFY(output.open(QIODevice::ReadOnly));
    const QByteArray written = output.readAll();
    QVERIFY(written.startsWith("%%{init"));
    QVERIFY(written.contains("class a[\"A\"]"));
}

void ImageRendererTests::testRendererFailure()
{
    archscope::RendererConfig config;
    config.program = writeScript(QStringLiteral("failing-renderer.sh"),
                                 "echo 'parse error' >&2\nexit 3\n").toStdString();
    const archscope::ImageRenderer renderer(config, m_tempDir.filePath(QStringLiteral("visuals")));

    const auto outcome = renderer.render("graph LR\n", QStringLiteral("connections"),
                                         QStringLiteral("png"), archscope::DiagramMode::Connections);
    QVERIFY(!outcome.ok);
    QVERIFY(outcome.error.contains(QStringLiteral("code 3")));
    QVERIFY(outcome.error.contains(QStringLiteral("parse error")));
}

void ImageRendererTests::testMissingProgram()
{
    archscope::RendererConfig config;
    config.program = m_tempDir.filePath(QStringLiteral("no-such-renderer")).toStdString();
    const archscope::ImageRenderer renderer(config, m_tempDir.filePath(QStringLiteral("visuals")));

    const auto outcome = renderer.render("graph LR\n", QStringLiteral("connections"),
                                         QStringLiteral("svg"), archscope::DiagramMode::Connections);
    QVERIFY(!outcome.ok);
    QVERIFY(outcome.outputPath.isEmpty());
    QVERIFY(outcome.error.contains(QStringLiteral("cannot start")));
}

void ImageRendererTests::testUnsupportedFormat()
{
    const archscope::ImageRenderer renderer(archscope::RendererConfig{},
                                            m_tempDir.filePath(QStringLiteral("visuals")));
    const auto outcome = renderer.render("graph LR\n", QStringLiteral("connections"),
                                         QStringLiteral("bmp"), archscope::DiagramMode::Connections);
    QVERIFY(!outcome.ok);
    QVERIFY(outcome.error.contains(QStringLiteral("bmp")));
}

QTEST_MAIN(ImageRendererTests)
#include "test_image_renderer.moc"
