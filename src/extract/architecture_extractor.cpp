#include "extract/architecture_extractor.hpp"

#include <optional>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QList>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include "common/logging.hpp"
#include "extract/name_resolver.hpp"
#include "extract/source_scanner.hpp"

namespace archscope {

namespace {

constexpr size_t kNpos = static_cast<size_t>(-1);

using Range = std::pair<size_t, size_t>;

size_t skipAttributes(const ScannedFile &f, size_t i, size_t end)
{
    while (i < end && f.is(i, "#")) {
        size_t open = i + 1;
        if (f.is(open, "!")) {
            ++open;
        }
        if (open >= end || !f.is(open, "[")) {
            break;
        }
        i = f.closing(open) + 1;
    }
    return i;
}

Visibility parseVisibility(const ScannedFile &f, size_t &cursor)
{
    if (!f.is(cursor, "pub")) {
        return Visibility::Private;
    }
    ++cursor;
    if (!f.is(cursor, "(")) {
        return Visibility::Public;
    }
    const size_t close = f.closing(cursor);
    const bool crateOnly = close == cursor + 2 && f.is(cursor + 1, "crate");
    cursor = close + 1;
    return crateOnly ? Visibility::Crate : Visibility::Restricted;
}

// Comma-separated segments at the top level of [begin, end).
std::vector<Range> splitTopLevel(const ScannedFile &f, size_t begin, size_t end,
                                 bool trackAngles)
{
    std::vector<Range> segments;
    int angles = 0;
    size_t start = begin;
    for (size_t i = begin; i < end; ++i) {
        if (f.is(i, "(") || f.is(i, "[") || f.is(i, "{")) {
            i = f.closing(i);
            continue;
        }
        if (trackAngles && f.is(i, "<")) {
            ++angles;
        } else if (trackAngles && f.is(i, ">") && angles > 0) {
            --angles;
        } else if (f.is(i, ",") && angles == 0) {
            if (start < i) {
                segments.emplace_back(start, i);
            }
            start = i + 1;
        }
    }
    if (start < end) {
        segments.emplace_back(start, end);
    }
    return segments;
}

// Type path text with generic arguments, references and lifetimes removed.
std::string pathWithoutGenerics(const ScannedFile &f, size_t begin, size_t end)
{
    std::string result;
    int depth = 0;
    for (size_t i = begin; i < end; ++i) {
        if (f.is(i, "<")) {
            ++depth;
            continue;
        }
        if (f.is(i, ">")) {
            --depth;
            continue;
        }
        if (depth > 0) {
            continue;
        }
        const Token &token = f.tokens[i];
        if (token.kind == TokenKind::Lifetime || f.is(i, "&") || f.is(i, "!")
            || f.is(i, "mut") || f.is(i, "dyn")) {
            continue;
        }
        result += token.text;
    }
    return result;
}

size_t matchingAngleBefore(const ScannedFile &f, size_t close, size_t begin)
{
    int depth = 0;
    for (size_t i = close + 1; i-- > begin;) {
        if (f.is(i, ")") || f.is(i, "]") || f.is(i, "}")) {
            i = f.closing(i);
            continue;
        }
        if (f.is(i, ">")) {
            ++depth;
        } else if (f.is(i, "<")) {
            --depth;
            if (depth == 0) {
                return i;
            }
        } else if (f.is(i, ";") || f.is(i, "{")) {
            break;
        }
    }
    return kNpos;
}

std::string receiverText(const ScannedFile &f, size_t dot, size_t begin)
{
    if (dot == begin) {
        return {};
    }
    const size_t receiver = dot - 1;
    if (!f.isIdentifier(receiver)) {
        return {};
    }
    const std::string &name = f.tokens[receiver].text;
    // self.field.method(): keep the field so the call can be resolved
    // through the field's declared type.
    if (receiver >= begin + 2 && f.is(receiver - 1, ".") && f.is(receiver - 2, "self")
        && !(receiver - 2 > begin && f.is(receiver - 3, "."))) {
        return "self." + name;
    }
    return name;
}

// True when the path starting at `first` sits in a `let`, `if let`,
// `while let` or `for` pattern rather than an expression.
bool inBindingPattern(const ScannedFile &f, size_t first, size_t begin)
{
    for (size_t i = first; i-- > begin;) {
        if (f.is(i, ")") || f.is(i, "]")) {
            i = f.closing(i);
            continue;
        }
        if (f.is(i, "let") || f.is(i, "for")) {
            return true;
        }
        if (f.is(i, ";") || f.is(i, "{") || f.is(i, "}") || f.is(i, "=")
            || f.is(i, "=>") || f.is(i, "in")) {
            return false;
        }
    }
    return false;
}

// The call whose argument list opens at `open`, if the tokens before it
// form a callable path or a method call. Tuple-struct and variant patterns
// (`Some(x) =>`, `let Point(x, y) = p`) are not calls.
std::optional<CallSite> callBefore(const ScannedFile &f, size_t open, size_t begin, size_t end)
{
    const size_t close = f.closing(open);
    if (close + 1 < end
        && (f.is(close + 1, "=>") || f.is(close + 1, "|") || f.is(close + 1, "if"))) {
        return std::nullopt;
    }
    if (open == begin) {
        return std::nullopt;
    }
    size_t nameIndex = open - 1;
    if (f.is(nameIndex, ">")) {
        // Turbofish: name::<T>(...)
        const size_t lt = matchingAngleBefore(f, nameIndex, begin);
        if (lt == kNpos || lt < begin + 2 || !f.is(lt - 1, "::")) {
            return std::nullopt;
        }
        nameIndex = lt - 2;
    }
    if (!f.isIdentifier(nameIndex)) {
        return std::nullopt;
    }
    const std::string &name = f.tokens[nameIndex].text;
    if (isRustKeyword(name) && name != "Self") {
        return std::nullopt;
    }
    if (nameIndex > begin && f.is(nameIndex - 1, "fn")) {
        return std::nullopt;
    }

    std::vector<std::string> segments{name};
    size_t first = nameIndex;
    while (first >= begin + 2 && f.is(first - 1, "::")) {
        const size_t previous = first - 2;
        if (f.is(previous, ">")) {
            const size_t lt = matchingAngleBefore(f, previous, begin);
            if (lt == kNpos) {
                break;
            }
            if (lt > begin && f.is(lt - 1, "::")) {
                first = lt;
                continue;
            }
            // Qualified path: <T as Trait>::method
            size_t asIndex = lt + 1;
            while (asIndex < previous && !f.is(asIndex, "as")) {
                ++asIndex;
            }
            segments.insert(segments.begin(), pathWithoutGenerics(f, lt + 1, asIndex));
            first = lt;
            break;
        }
        if (!f.isIdentifier(previous)) {
            break;
        }
        segments.insert(segments.begin(), f.tokens[previous].text);
        first = previous;
    }

    if (inBindingPattern(f, first, begin)) {
        return std::nullopt;
    }

    CallSite call;
    call.line = f.tokens[nameIndex].line;
    if (segments.size() == 1 && first > begin && f.is(first - 1, ".")) {
        // Chained or indexed receivers (`a().b()`, `v[0].len()`) have no
        // name to resolve against.
        const std::string receiver = receiverText(f, first - 1, begin);
        if (receiver.empty()) {
            return std::nullopt;
        }
        call.callee = receiver + "." + name;
    } else {
        call.callee = joinPath(segments);
    }
    return call;
}

std::vector<CallSite> scanCalls(const ScannedFile &f, size_t begin, size_t end)
{
    std::vector<CallSite> calls;
    for (size_t i = begin; i < end; ++i) {
        if (!f.is(i, "(")) {
            continue;
        }
        if (auto call = callBefore(f, i, begin, end)) {
            calls.push_back(std::move(*call));
        }
    }
    return calls;
}

class UnitBuilder {
public:
    UnitBuilder(const ScannedFile &file, SourceUnit &unit)
        : m_file(file)
        , m_unit(unit)
    {
    }

    void add(const Declaration &declaration)
    {
        switch (declaration.kind) {
        case DeclarationKind::Struct:
        case DeclarationKind::Union:
        case DeclarationKind::Enum:
        case DeclarationKind::Trait:
            addType(declaration);
            break;
        case DeclarationKind::Impl:
            addImpl(declaration);
            break;
        case DeclarationKind::Use:
            addUse(declaration);
            break;
        case DeclarationKind::ExternCrate:
            addExternCrate(declaration);
            break;
        }
    }

private:
    std::string moduleFor(const Declaration &declaration) const
    {
        std::string module = m_unit.modulePath;
        for (const auto &segment : declaration.modulePath) {
            module += "::" + segment;
        }
        return module;
    }

    SourceLocation locationOf(const Declaration &declaration) const
    {
        return SourceLocation{m_unit.path, declaration.lineStart, declaration.lineEnd};
    }

    void addType(const Declaration &declaration)
    {
        size_t cursor = declaration.begin;
        TypeDefinition type;
        type.visibility = parseVisibility(m_file, cursor);
        while (m_file.is(cursor, "unsafe") || m_file.is(cursor, "auto")) {
            ++cursor;
        }
        if (m_file.is(cursor, "enum")) {
            type.kind = TypeKind::Enum;
        } else if (m_file.is(cursor, "trait")) {
            type.kind = TypeKind::Trait;
        } else {
            type.kind = TypeKind::Struct;
        }
        ++cursor;
        if (!m_file.isIdentifier(cursor)) {
            return;
        }
        type.name = m_file.tokens[cursor].text;
        type.qualifiedName = moduleFor(declaration) + "::" + type.name;
        type.location = locationOf(declaration);
        cursor = m_file.skipAngles(cursor + 1, declaration.end);

        if (type.kind != TypeKind::Trait) {
            type.fields = parseFields(type.kind, cursor, declaration.end);
        }
        m_unit.types.push_back(std::move(type));
    }

    std::vector<FieldDefinition> parseFields(TypeKind kind, size_t cursor, size_t end) const
    {
        std::vector<FieldDefinition> fields;
        if (kind == TypeKind::Struct && m_file.is(cursor, "(")) {
            const size_t close = m_file.closing(cursor);
            int index = 0;
            for (const auto &[begin, segmentEnd] : splitTopLevel(m_file, cursor + 1, close, true)) {
                size_t start = skipAttributes(m_file, begin, segmentEnd);
                parseVisibility(m_file, start);
                if (start >= segmentEnd) {
                    continue;
                }
                fields.push_back({std::to_string(index++), m_file.join(start, segmentEnd)});
            }
            return fields;
        }

        size_t open = cursor;
        while (open < end && !m_file.is(open, "{") && !m_file.is(open, ";")) {
            ++open;
        }
        if (open >= end || !m_file.is(open, "{")) {
            return fields;
        }
        const size_t close = m_file.closing(open);
        const bool isEnum = kind == TypeKind::Enum;
        for (const auto &[begin, segmentEnd] : splitTopLevel(m_file, open + 1, close, !isEnum)) {
            size_t start = skipAttributes(m_file, begin, segmentEnd);
            parseVisibility(m_file, start);
            if (start >= segmentEnd || !m_file.isIdentifier(start)) {
                continue;
            }
            FieldDefinition field;
            field.name = m_file.tokens[start].text;
            if (isEnum) {
                field.typeText = m_file.join(start + 1, segmentEnd);
            } else if (start + 1 < segmentEnd && m_file.is(start + 1, ":")) {
                field.typeText = m_file.join(start + 2, segmentEnd);
            }
            fields.push_back(std::move(field));
        }
        return fields;
    }

    void addImpl(const Declaration &declaration)
    {
        size_t cursor = declaration.begin;
        while (m_file.is(cursor, "unsafe") || m_file.is(cursor, "default")) {
            ++cursor;
        }
        if (!m_file.is(cursor, "impl")) {
            return;
        }
        cursor = m_file.skipAngles(cursor + 1, declaration.end);

        size_t body = cursor;
        while (body < declaration.end && !m_file.is(body, "{")) {
            if (m_file.is(body, "(") || m_file.is(body, "[")) {
                body = m_file.closing(body);
            }
            ++body;
        }
        if (body >= declaration.end) {
            return;
        }

        size_t headerEnd = body;
        size_t forIndex = kNpos;
        int depth = 0;
        for (size_t i = cursor; i < body; ++i) {
            if (m_file.is(i, "(") || m_file.is(i, "[")) {
                i = m_file.closing(i);
            } else if (m_file.is(i, "<")) {
                ++depth;
            } else if (m_file.is(i, ">")) {
                --depth;
            } else if (depth == 0 && m_file.is(i, "where")) {
                headerEnd = i;
                break;
            } else if (depth == 0 && forIndex == kNpos && m_file.is(i, "for")
                       && !m_file.is(i + 1, "<")) {
                forIndex = i;
            }
        }

        ImplBlock impl;
        impl.location = locationOf(declaration);
        std::string target;
        if (forIndex != kNpos) {
            impl.traitName = pathWithoutGenerics(m_file, cursor, forIndex);
            target = pathWithoutGenerics(m_file, forIndex + 1, headerEnd);
        } else {
            target = pathWithoutGenerics(m_file, cursor, headerEnd);
        }
        if (target.empty()) {
            return;
        }
        impl.targetType = target;
        impl.scope = joinPath(declaration.modulePath);
        impl.methods = parseMethods(body + 1, m_file.closing(body));
        m_unit.impls.push_back(std::move(impl));
    }

    std::vector<Method> parseMethods(size_t begin, size_t end) const
    {
        std::vector<Method> methods;
        size_t i = begin;
        while (i < end) {
            i = skipAttributes(m_file, i, end);
            if (i >= end) {
                break;
            }
            const size_t itemStart = i;
            size_t cursor = i;
            parseVisibility(m_file, cursor);
            while (m_file.is(cursor, "const") || m_file.is(cursor, "async")
                   || m_file.is(cursor, "unsafe") || m_file.is(cursor, "default")
                   || (m_file.is(cursor, "extern")
                       && cursor + 1 < end
                       && m_file.tokens[cursor + 1].kind == TokenKind::String)) {
                cursor += m_file.is(cursor, "extern") ? 2 : 1;
            }

            if (!m_file.is(cursor, "fn") || !m_file.isIdentifier(cursor + 1)) {
                i = skipImplItem(cursor, end);
                continue;
            }

            Method method;
            method.name = m_file.tokens[cursor + 1].text;
            size_t bodyOpen = cursor + 2;
            while (bodyOpen < end && !m_file.is(bodyOpen, "{") && !m_file.is(bodyOpen, ";")) {
                if (m_file.is(bodyOpen, "(") || m_file.is(bodyOpen, "[")) {
                    bodyOpen = m_file.closing(bodyOpen);
                }
                ++bodyOpen;
            }
            method.signature = m_file.join(itemStart, bodyOpen);
            if (bodyOpen < end && m_file.is(bodyOpen, "{")) {
                const size_t bodyClose = m_file.closing(bodyOpen);
                method.calls = scanCalls(m_file, bodyOpen + 1, bodyClose);
                i = bodyClose + 1;
            } else {
                i = bodyOpen + 1;
            }
            methods.push_back(std::move(method));
        }
        return methods;
    }

    // Associated consts, types and macro invocations inside an impl.
    size_t skipImplItem(size_t i, size_t end) const
    {
        while (i < end) {
            if (m_file.is(i, "{")) {
                return m_file.closing(i) + 1;
            }
            if (m_file.is(i, "(") || m_file.is(i, "[")) {
                i = m_file.closing(i) + 1;
                continue;
            }
            if (m_file.is(i, ";")) {
                return i + 1;
            }
            ++i;
        }
        return end;
    }

    void addUse(const Declaration &declaration)
    {
        size_t cursor = declaration.begin;
        parseVisibility(m_file, cursor);
        if (!m_file.is(cursor, "use")) {
            return;
        }
        size_t end = declaration.end;
        if (end > cursor && m_file.is(end - 1, ";")) {
            --end;
        }
        m_useScope = joinPath(declaration.modulePath);
        expandUseTree(cursor + 1, end, {});
    }

    void expandUseTree(size_t begin, size_t end, std::vector<std::string> segments)
    {
        size_t i = begin;
        if (m_file.is(i, "::")) {
            ++i;
        }
        while (i < end) {
            if (m_file.is(i, "{")) {
                const size_t close = m_file.closing(i);
                for (const auto &[groupBegin, groupEnd] :
                     splitTopLevel(m_file, i + 1, close, false)) {
                    expandUseTree(groupBegin, groupEnd, segments);
                }
                return;
            }
            if (m_file.is(i, "*")) {
                segments.push_back("*");
                m_unit.imports.push_back(Import{joinPath(segments), std::nullopt, m_useScope});
                return;
            }
            if (!m_file.isIdentifier(i)) {
                ++i;
                continue;
            }
            const std::string name = m_file.tokens[i].text;
            ++i;
            if (m_file.is(i, "::") && i < end) {
                segments.push_back(name);
                ++i;
                continue;
            }
            if (name != "self") {
                segments.push_back(name);
            }
            if (segments.empty()) {
                return;
            }
            Import import{joinPath(segments), std::nullopt, m_useScope};
            if (i + 1 < end && m_file.is(i, "as")) {
                import.alias = m_file.tokens[i + 1].text;
            }
            m_unit.imports.push_back(std::move(import));
            return;
        }
    }

    void addExternCrate(const Declaration &declaration)
    {
        size_t cursor = declaration.begin;
        parseVisibility(m_file, cursor);
        // extern crate name [as alias];
        if (!m_file.isIdentifier(cursor + 2)) {
            return;
        }
        Import import{m_file.tokens[cursor + 2].text, std::nullopt,
                      joinPath(declaration.modulePath)};
        if (m_file.is(cursor + 3, "as") && cursor + 4 < declaration.end) {
            import.alias = m_file.tokens[cursor + 4].text;
        }
        m_unit.imports.push_back(std::move(import));
    }

    const ScannedFile &m_file;
    SourceUnit &m_unit;
    std::string m_useScope;
};

struct FileJob {
    QString absolutePath;
    std::string relativePath;
};

struct FileOutcome {
    std::string relativePath;
    std::optional<SourceUnit> unit;
    std::optional<ScanError> error;
};

void collectSourceFiles(const QDir &root, const QDir &dir, const ArchscopeConfig &config,
                        QList<FileJob> &jobs)
{
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot | QDir::NoSymLinks, QDir::Name);
    for (const QFileInfo &entry : entries) {
        if (entry.isDir()) {
            const std::string relative =
                root.relativeFilePath(entry.absoluteFilePath()).toStdString();
            if (config.isExcludedPath(relative)) {
                ALOG_DEBUG(QStringLiteral("Extractor"),
                           QStringLiteral("collectSourceFiles"),
                           QStringLiteral("dir_excluded"),
                           QStringLiteral("excluded_by_config"),
                           QStringLiteral("directory_walk"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"dir", relative}}));
                continue;
            }
            collectSourceFiles(root, QDir(entry.absoluteFilePath()), config, jobs);
            continue;
        }
        if (config.hasSourceExtension(entry.fileName().toStdString())) {
            jobs.append(FileJob{entry.absoluteFilePath(),
                                root.relativeFilePath(entry.absoluteFilePath()).toStdString()});
        }
    }
}

FileOutcome extractJob(const FileJob &job, const QString &corrId)
{
    logging::CorrelationScope scope(corrId);
    FileOutcome outcome;
    outcome.relativePath = job.relativePath;

    QFile file(job.absolutePath);
    if (!file.open(QIODevice::ReadOnly)) {
        outcome.error = ScanError(job.relativePath, 0, "cannot read file");
        return outcome;
    }
    const std::string text = file.readAll().toStdString();

    try {
        outcome.unit = extract(job.relativePath, text);
        ALOG_DEBUG(QStringLiteral("Extractor"),
                   QStringLiteral("extractJob"),
                   QStringLiteral("file_extracted"),
                   QStringLiteral("source_file_found"),
                   QStringLiteral("scan"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"path", job.relativePath},
                                   {"types", outcome.unit->types.size()},
                                   {"impls", outcome.unit->impls.size()}}));
    } catch (const ScanError &error) {
        outcome.error = error;
    }
    return outcome;
}

} // namespace

std::string modulePathForFile(const std::string &relativePath)
{
    std::vector<std::string> components;
    size_t start = 0;
    while (start <= relativePath.size()) {
        const size_t slash = relativePath.find('/', start);
        const std::string component = relativePath.substr(
            start, slash == std::string::npos ? std::string::npos : slash - start);
        if (!component.empty() && component != ".") {
            components.push_back(component);
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    if (components.size() > 1 && components.front() == "src") {
        components.erase(components.begin());
    }
    if (!components.empty()) {
        std::string &last = components.back();
        const size_t dot = last.rfind('.');
        if (dot != std::string::npos && dot > 0) {
            last = last.substr(0, dot);
        }
        if (last == "mod" || last == "lib" || last == "main") {
            components.pop_back();
        }
    }

    std::string module = "crate";
    for (const auto &component : components) {
        module += "::" + component;
    }
    return module;
}

SourceUnit extract(const std::string &filePath, const std::string &text)
{
    ScannedFile scanned;
    try {
        scanned = scanSource(text);
    } catch (const ScanError &error) {
        throw error.withFile(filePath);
    }

    SourceUnit unit;
    unit.path = filePath;
    unit.modulePath = modulePathForFile(filePath);

    UnitBuilder builder(scanned, unit);
    for (const auto &declaration : scanned.declarations) {
        builder.add(declaration);
    }
    canonicalize(unit);
    return unit;
}

ExtractionResult extractTree(const QString &root, const ArchscopeConfig &config)
{
    const QFileInfo rootInfo(root);
    if (!rootInfo.exists()) {
        throw ArchscopeError("source path does not exist: " + root.toStdString());
    }

    QList<FileJob> jobs;
    if (rootInfo.isFile()) {
        jobs.append(FileJob{rootInfo.absoluteFilePath(), rootInfo.fileName().toStdString()});
    } else {
        const QDir rootDir(rootInfo.absoluteFilePath());
        collectSourceFiles(rootDir, rootDir, config, jobs);
    }

    const QString corrId = logging::newCorrelationId();
    logging::CorrelationScope scope(corrId);
    ALOG_INFO(QStringLiteral("Extractor"),
              QStringLiteral("extractTree"),
              QStringLiteral("extraction_started"),
              QStringLiteral("extract_requested"),
              QStringLiteral("walk_tree"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"root", rootInfo.absoluteFilePath().toStdString()},
                              {"files", jobs.size()}}));

    QThreadPool pool;
    if (config.workerThreads > 0) {
        pool.setMaxThreadCount(config.workerThreads);
    }
    const QList<FileOutcome> outcomes = QtConcurrent::blockingMapped<QList<FileOutcome>>(
        &pool, jobs, [corrId](const FileJob &job) { return extractJob(job, corrId); });

    // Everything below runs after the join.
    ExtractionResult result;
    for (const FileOutcome &outcome : outcomes) {
        if (outcome.unit.has_value()) {
            result.snapshot.units.emplace(outcome.relativePath, *outcome.unit);
            continue;
        }
        if (outcome.error.has_value()) {
            result.skipped.push_back(*outcome.error);
            ALOG_WARN(QStringLiteral("Extractor"),
                      QStringLiteral("extractTree"),
                      QStringLiteral("file_skipped"),
                      QStringLiteral("scan_error"),
                      QStringLiteral("scan"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"path", outcome.error->file()},
                                      {"line", outcome.error->line()},
                                      {"reason", outcome.error->reason()}}));
        }
    }

    rebuildRegistry(result.snapshot);
    for (const auto &duplicate : result.snapshot.duplicates) {
        ALOG_WARN(QStringLiteral("Extractor"),
                  QStringLiteral("extractTree"),
                  QStringLiteral("duplicate_type"),
                  QStringLiteral("qualified_name_collision"),
                  QStringLiteral("registry_build"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"name", duplicate.qualifiedName()},
                                  {"first", duplicate.first().file},
                                  {"second", duplicate.second().file}}));
    }

    resolveCallTargets(result.snapshot);

    ALOG_INFO(QStringLiteral("Extractor"),
              QStringLiteral("extractTree"),
              QStringLiteral("extraction_finished"),
              QStringLiteral("all_files_processed"),
              QStringLiteral("merge_and_resolve"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"units", result.snapshot.units.size()},
                              {"types", result.snapshot.typeCount()},
                              {"skipped", result.skipped.size()},
                              {"duplicates", result.snapshot.duplicates.size()},
                              {"unresolvedCalls", result.snapshot.unresolvedCallCount()}}));
    return result;
}

} // namespace archscope
