#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace archscope {

class ArchscopeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unbalanced or unterminated syntax. Fatal to one file only.
class ScanError : public ArchscopeError {
public:
    ScanError(std::string file, int line, const std::string &message)
        : ArchscopeError(file + ":" + std::to_string(line) + ": " + message)
        , m_file(std::move(file))
        , m_line(line)
        , m_reason(message)
    {
    }

    const std::string &file() const { return m_file; }
    int line() const { return m_line; }
    const std::string &reason() const { return m_reason; }

    // The scanner does not know which file it reads; the extractor fills it in.
    ScanError withFile(const std::string &file) const
    {
        return ScanError(file, m_line, m_reason);
    }

private:
    std::string m_file;
    int m_line;
    std::string m_reason;
};

// Two type definitions share one qualified name.
class DuplicateTypeError : public ArchscopeError {
public:
    DuplicateTypeError(std::string qualifiedName, SourceLocation first,
                       SourceLocation second)
        : ArchscopeError("duplicate type " + qualifiedName + " defined at "
                         + first.file + ":" + std::to_string(first.lineStart)
                         + " and " + second.file + ":"
                         + std::to_string(second.lineStart))
        , m_qualifiedName(std::move(qualifiedName))
        , m_first(std::move(first))
        , m_second(std::move(second))
    {
    }

    const std::string &qualifiedName() const { return m_qualifiedName; }
    const SourceLocation &first() const { return m_first; }
    const SourceLocation &second() const { return m_second; }

private:
    std::string m_qualifiedName;
    SourceLocation m_first;
    SourceLocation m_second;
};

class GraphError : public ArchscopeError {
public:
    explicit GraphError(std::vector<std::string> duplicateNames)
        : ArchscopeError(buildMessage(duplicateNames))
        , m_names(std::move(duplicateNames))
    {
    }

    const std::vector<std::string> &duplicateNames() const { return m_names; }

private:
    static std::string buildMessage(const std::vector<std::string> &names)
    {
        std::string message = "snapshot contains duplicate type names:";
        for (const auto &name : names) {
            message += " " + name;
        }
        return message;
    }

    std::vector<std::string> m_names;
};

class SnapshotReadError : public ArchscopeError {
public:
    SnapshotReadError(std::string path, const std::string &message)
        : ArchscopeError(path + ": " + message)
        , m_path(std::move(path))
    {
    }

    const std::string &path() const { return m_path; }

private:
    std::string m_path;
};

class DiffIncompatibleError : public ArchscopeError {
public:
    DiffIncompatibleError(std::string directory, const std::string &reason)
        : ArchscopeError("cannot diff " + directory + ": " + reason)
        , m_directory(std::move(directory))
    {
    }

    const std::string &directory() const { return m_directory; }

private:
    std::string m_directory;
};

// Graph state that cannot be serialized into valid markup.
class RenderMarkupError : public ArchscopeError {
public:
    using ArchscopeError::ArchscopeError;
};

class ConfigError : public ArchscopeError {
public:
    using ArchscopeError::ArchscopeError;
};

} // namespace archscope
