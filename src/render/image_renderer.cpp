#include "render/image_renderer.hpp"

#include <utility>

#include <QDir>
#include <QFile>
#include <QProcess>
#include <QTemporaryDir>

#include "common/logging.hpp"

namespace archscope {

namespace {

const char *kClassTheme =
    "%%{init: {'theme': 'base', 'themeVariables': {"
    "'primaryColor': '#eef3fb', 'primaryBorderColor': '#4a6fa5', "
    "'lineColor': '#4a6fa5', 'fontFamily': 'monospace'}}}%%\n";

RenderOutcome failure(const QString &message)
{
    ALOG_WARN(QStringLiteral("ImageRenderer"),
              QStringLiteral("render"),
              QStringLiteral("render_failed"),
              QStringLiteral("renderer_error"),
              QStringLiteral("qprocess"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"error", message.toStdString()}}));
    return RenderOutcome{false, QString(), message};
}

} // namespace

ImageRenderer::ImageRenderer(RendererConfig config, QString visualsDir)
    : m_config(std::move(config))
    , m_visualsDir(std::move(visualsDir))
{
}

bool ImageRenderer::isSupportedFormat(const QString &format)
{
    return format == QStringLiteral("svg") || format == QStringLiteral("png")
        || format == QStringLiteral("pdf");
}

std::string ImageRenderer::withTheme(const std::string &markup, DiagramMode mode)
{
    if (mode != DiagramMode::Class) {
        return markup;
    }
    return kClassTheme + markup;
}

QStringList ImageRenderer::argumentsFor(const QString &inputPath, const QString &outputPath) const
{
    QStringList arguments{QStringLiteral("-i"), inputPath, QStringLiteral("-o"), outputPath};
    if (!m_config.configFile.empty()) {
        arguments << QStringLiteral("--configFile") << QString::fromStdString(m_config.configFile);
    }
    if (!m_config.cssFile.empty()) {
        arguments << QStringLiteral("--cssFile") << QString::fromStdString(m_config.cssFile);
    }
    return arguments;
}

RenderOutcome ImageRenderer::render(const std::string &markup,
                                    const QString &name,
                                    const QString &format,
                                    DiagramMode mode) const
{
    if (!isSupportedFormat(format)) {
        return failure(QStringLiteral("unsupported image format: %1").arg(format));
    }
    if (!QDir().mkpath(m_visualsDir)) {
        return failure(QStringLiteral("cannot create %1").arg(m_visualsDir));
    }

    QTemporaryDir scratch;
    if (!scratch.isValid()) {
        return failure(QStringLiteral("cannot create a temporary directory"));
    }
    const QString inputPath = scratch.filePath(name + QStringLiteral(".mmd"));
    QFile input(inputPath);
    if (!input.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return failure(QStringLiteral("cannot write %1").arg(inputPath));
    }
    input.write(QByteArray::fromStdString(withTheme(markup, mode)));
    input.close();

    const QString outputPath = QDir(m_visualsDir).filePath(name + QStringLiteral(".") + format);
    const QString program = QString::fromStdString(m_config.program);

    QProcess process;
    process.start(program, argumentsFor(inputPath, outputPath));
    if (!process.waitForStarted()) {
        return failure(QStringLiteral("cannot start %1").arg(program));
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(m_config.timeoutMs)) {
        process.kill();
        process.waitForFinished();
        return failure(QStringLiteral("%1 timed out after %2 ms").arg(program).arg(m_config.timeoutMs));
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString details = QString::fromUtf8(process.readAllStandardError()).trimmed();
        return failure(QStringLiteral("%1 exited with code %2: %3")
                           .arg(program)
                           .arg(process.exitCode())
                           .arg(details));
    }

    ALOG_INFO(QStringLiteral("ImageRenderer"),
              QStringLiteral("render"),
              QStringLiteral("image_rendered"),
              QStringLiteral("view_requested"),
              QStringLiteral("qprocess"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"program", m_config.program},
                              {"output", outputPath.toStdString()},
                              {"format", format.toStdString()}}));
    return RenderOutcome{true, outputPath, QString()};
}

} // namespace archscope
