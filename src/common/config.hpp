#pragma once

#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

namespace archscope {

struct RendererConfig {
    std::string program = "mmdc";
    int timeoutMs = 60000;
    std::string configFile;
    std::string cssFile;
};

struct ArchscopeConfig {
    std::vector<std::string> extensions = {".rs"};
    // Matched by directory name at any depth.
    std::vector<std::string> excludeDirs = {"target", ".git"};

    // Output directories, skipped only directly under the scan root.

    std::string architectureDir = "architecture";
    std::string diagramsDir = "diagrams";
    std::string visualsDir = "visuals";

    // 0 lets the worker pool pick the ideal thread count.
    int workerThreads = 0;
    bool strictDuplicates = false;
    bool trace = false;

    RendererConfig renderer;

    bool isExcludedDir(const std::string &name) const;
    // `relativeDir` is relative to the scan root: "src/diagrams".
    bool isExcludedPath(const std::string &relativeDir) const;
    bool hasSourceExtension(const std::string &fileName) const;
};

// Default lookup: archscope.json in the working directory, if present.
// Environment variables (ARCHSCOPE_*) override file values.
// Throws ConfigError when an explicitly named or present file is malformed.
ArchscopeConfig loadConfig(const QString &explicitPath = QString());

ArchscopeConfig configFromJson(const nlohmann::json &j);
void applyEnvironmentOverrides(ArchscopeConfig &config);

} // namespace archscope
