#pragma once

#include <string>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/enums.hpp"

namespace archscope {

struct RenderOutcome {
    bool ok = false;
    QString outputPath;
    QString error;
};

// ImageRenderer hands Mermaid markup to the external renderer (mmdc by
// default) and waits for it with the configured timeout. Images are written
// to <visualsDir>/<name>.<format>.
class ImageRenderer {
public:
    ImageRenderer(RendererConfig config, QString visualsDir);

    static bool isSupportedFormat(const QString &format);

    RenderOutcome render(const std::string &markup,
                         const QString &name,
                         const QString &format,
                         DiagramMode mode) const;

    QStringList argumentsFor(const QString &inputPath, const QString &outputPath) const;

    // Class diagrams get an init directive selecting the diagram theme.
    static std::string withTheme(const std::string &markup, DiagramMode mode);

private:
    RendererConfig m_config;
    QString m_visualsDir;
};

} // namespace archscope
