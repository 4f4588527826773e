#include "common/config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace archscope {

namespace {

const QString kDefaultConfigName = QStringLiteral("archscope.json");

std::vector<std::string> stringList(const nlohmann::json &j, const char *key,
                                    const std::vector<std::string> &fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    const auto &value = j.at(key);
    if (!value.is_array()) {
        throw ConfigError(std::string("config key '") + key + "' must be an array");
    }
    std::vector<std::string> result;
    for (const auto &item : value) {
        if (!item.is_string()) {
            throw ConfigError(std::string("config key '") + key
                              + "' must contain strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // namespace

bool ArchscopeConfig::isExcludedDir(const std::string &name) const
{
    for (const auto &excluded : excludeDirs) {
        if (excluded == name) {
            return true;
        }
    }
    return false;
}

bool ArchscopeConfig::isExcludedPath(const std::string &relativeDir) const
{
    const QString relative = QDir::cleanPath(QString::fromStdString(relativeDir));
    if (isExcludedDir(QFileInfo(relative).fileName().toStdString())) {
        return true;
    }
    for (const std::string *output : {&architectureDir, &diagramsDir, &visualsDir}) {
        if (!output->empty()
            && relative == QDir::cleanPath(QString::fromStdString(*output))) {
            return true;
        }
    }
    return false;
}

bool ArchscopeConfig::hasSourceExtension(const std::string &fileName) const
{
    for (const auto &extension : extensions) {
        if (fileName.size() >= extension.size()
            && fileName.compare(fileName.size() - extension.size(),
                                extension.size(), extension) == 0) {
            return true;
        }
    }
    return false;
}

ArchscopeConfig configFromJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    ArchscopeConfig config;
    try {
        config.extensions = stringList(j, "extensions", config.extensions);
        config.excludeDirs = stringList(j, "excludeDirs", config.excludeDirs);
        config.architectureDir = j.value("architectureDir", config.architectureDir);
        config.diagramsDir = j.value("diagramsDir", config.diagramsDir);
        config.visualsDir = j.value("visualsDir", config.visualsDir);
        config.workerThreads = j.value("workerThreads", config.workerThreads);
        config.strictDuplicates = j.value("strictDuplicates", config.strictDuplicates);
        config.trace = j.value("trace", config.trace);

        if (j.contains("renderer")) {
            const auto &renderer = j.at("renderer");
            if (!renderer.is_object()) {
                throw ConfigError("config key 'renderer' must be an object");
            }
            config.renderer.program = renderer.value("program", config.renderer.program);
            config.renderer.timeoutMs = renderer.value("timeoutMs", config.renderer.timeoutMs);
            config.renderer.configFile = renderer.value("configFile", config.renderer.configFile);
            config.renderer.cssFile = renderer.value("cssFile", config.renderer.cssFile);
        }
    } catch (const nlohmann::json::type_error &ex) {
        throw ConfigError(std::string("config value has the wrong type: ") + ex.what());
    }

    if (config.workerThreads < 0) {
        throw ConfigError("workerThreads must not be negative");
    }
    if (config.renderer.timeoutMs <= 0) {
        throw ConfigError("renderer.timeoutMs must be positive");
    }
    return config;
}

void applyEnvironmentOverrides(ArchscopeConfig &config)
{
    const QString renderer = qEnvironmentVariable("ARCHSCOPE_RENDERER");
    if (!renderer.isEmpty()) {
        config.renderer.program = renderer.toStdString();
    }

    bool ok = false;
    const int timeout = qEnvironmentVariableIntValue("ARCHSCOPE_RENDER_TIMEOUT_MS", &ok);
    if (ok && timeout > 0) {
        config.renderer.timeoutMs = timeout;
    }

    const int workers = qEnvironmentVariableIntValue("ARCHSCOPE_WORKERS", &ok);
    if (ok && workers >= 0) {
        config.workerThreads = workers;
    }

    if (qEnvironmentVariableIntValue("ARCHSCOPE_TRACE") == 1) {
        config.trace = true;
    }
}

ArchscopeConfig loadConfig(const QString &explicitPath)
{
    const QString path = explicitPath.isEmpty()
        ? QDir::current().filePath(kDefaultConfigName)
        : explicitPath;

    ArchscopeConfig config;
    if (QFileInfo::exists(path)) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw ConfigError("cannot open config file " + path.toStdString());
        }
        const QByteArray data = file.readAll();
        try {
            config = configFromJson(nlohmann::json::parse(data.toStdString()));
        } catch (const nlohmann::json::parse_error &ex) {
            throw ConfigError("malformed config file " + path.toStdString() + ": "
                              + ex.what());
        }
        ALOG_DEBUG(QStringLiteral("Config"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_loaded"),
                   QStringLiteral("config_file_present"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()}}));
    } else if (!explicitPath.isEmpty()) {
        throw ConfigError("config file not found: " + path.toStdString());
    }

    applyEnvironmentOverrides(config);
    return config;
}

} // namespace archscope
