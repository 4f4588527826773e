#include "extract/source_scanner.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <string_view>

#include "common/errors.hpp"

namespace archscope {

namespace {

constexpr size_t kNoPartner = static_cast<size_t>(-1);

bool isIdentStart(unsigned char c)
{
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isIdentChar(unsigned char c)
{
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

size_t utf8Length(unsigned char lead)
{
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    return 4;
}

constexpr std::array<std::string_view, 14> kTwoCharPuncts = {
    "::", "->", "=>", "==", "!=", "<=", ">=", "&&", "||", "..",
    "+=", "-=", "*=", "/=",
};

class Lexer {
public:
    explicit Lexer(const std::string &text)
        : m_text(text)
    {
    }

    std::vector<Token> run()
    {
        std::vector<Token> tokens;
        while (m_pos < m_text.size()) {
            const unsigned char c = static_cast<unsigned char>(m_text[m_pos]);
            if (c == '\n') {
                ++m_line;
                ++m_pos;
                continue;
            }
            if (std::isspace(c)) {
                ++m_pos;
                continue;
            }
            if (c == '/' && peek(1) == '/') {
                skipLineComment();
                continue;
            }
            if (c == '/' && peek(1) == '*') {
                skipBlockComment();
                continue;
            }

            if (startsRawString()) {
                tokens.push_back(readRawString());
                continue;
            }
            if ((c == 'b' || c == 'c') && peek(1) == '"') {
                const int line = m_line;
                ++m_pos;
                tokens.push_back(readQuoted(line, 1));
                continue;
            }
            if (c == 'b' && peek(1) == '\'') {
                const int line = m_line;
                ++m_pos;
                tokens.push_back(readCharLiteral(line, 1));
                continue;
            }
            if (c == 'r' && peek(1) == '#' && isIdentStart(static_cast<unsigned char>(peek(2)))) {
                // Raw identifier: r#type
                m_pos += 2;
                tokens.push_back(readIdentifier());
                continue;
            }
            if (isIdentStart(c)) {
                tokens.push_back(readIdentifier());
                continue;
            }
            if (std::isdigit(c)) {
                tokens.push_back(readNumber());
                continue;
            }
            if (c == '"') {
                tokens.push_back(readQuoted(m_line, 0));
                continue;
            }
            if (c == '\'') {
                tokens.push_back(readCharOrLifetime());
                continue;
            }
            tokens.push_back(readPunct());
        }
        return tokens;
    }

private:
    char peek(size_t ahead) const
    {
        return m_pos + ahead < m_text.size() ? m_text[m_pos + ahead] : '\0';
    }

    void skipLineComment()
    {
        while (m_pos < m_text.size() && m_text[m_pos] != '\n') {
            ++m_pos;
        }
    }

    void skipBlockComment()
    {
        const int startLine = m_line;
        int depth = 0;
        while (m_pos < m_text.size()) {
            if (m_text[m_pos] == '/' && peek(1) == '*') {
                ++depth;
                m_pos += 2;
                continue;
            }
            if (m_text[m_pos] == '*' && peek(1) == '/') {
                --depth;
                m_pos += 2;
                if (depth == 0) {
                    return;
                }
                continue;
            }
            if (m_text[m_pos] == '\n') {
                ++m_line;
            }
            ++m_pos;
        }
        throw ScanError({}, startLine, "unterminated block comment");
    }

    bool startsRawString() const
    {
        size_t offset = 0;
        if ((peek(0) == 'b' || peek(0) == 'c') && peek(1) == 'r') {
            offset = 1;
        }
        if (peek(offset) != 'r') {
            return false;
        }
        size_t cursor = offset + 1;
        while (peek(cursor) == '#') {
            ++cursor;
        }
        return peek(cursor) == '"';
    }

    Token readRawString()
    {
        const int startLine = m_line;
        const size_t start = m_pos;
        while (m_text[m_pos] != 'r') {
            ++m_pos;
        }
        ++m_pos;
        size_t hashes = 0;
        while (peek(0) == '#') {
            ++hashes;
            ++m_pos;
        }
        ++m_pos; // opening quote

        while (m_pos < m_text.size()) {
            if (m_text[m_pos] == '"') {
                size_t closing = 0;
                while (closing < hashes && peek(1 + closing) == '#') {
                    ++closing;
                }
                if (closing == hashes) {
                    m_pos += 1 + hashes;
                    return Token{TokenKind::String, m_text.substr(start, m_pos - start), startLine};
                }
            }
            if (m_text[m_pos] == '\n') {
                ++m_line;
            }
            ++m_pos;
        }
        throw ScanError({}, startLine, "unterminated raw string literal");
    }

    // m_pos is on the opening quote; `prefix` bytes precede it.
    Token readQuoted(int startLine, size_t prefix)
    {
        const size_t start = m_pos - prefix;
        ++m_pos;
        while (m_pos < m_text.size()) {
            const char c = m_text[m_pos];
            if (c == '\\') {
                if (peek(1) == '\n') {
                    ++m_line;
                }
                m_pos += 2;
                continue;
            }
            if (c == '\n') {
                ++m_line;
            }
            ++m_pos;
            if (c == '"') {
                return Token{TokenKind::String, m_text.substr(start, m_pos - start), startLine};
            }
        }
        throw ScanError({}, startLine, "unterminated string literal");
    }

    Token readCharLiteral(int startLine, size_t prefix)
    {
        const size_t start = m_pos - prefix;
        ++m_pos;
        while (m_pos < m_text.size()) {
            const char c = m_text[m_pos];
            if (c == '\n') {
                break;
            }
            if (c == '\\') {
                m_pos += 2;
                continue;
            }
            ++m_pos;
            if (c == '\'') {
                return Token{TokenKind::Char, m_text.substr(start, m_pos - start), startLine};
            }
        }
        throw ScanError({}, startLine, "unterminated character literal");
    }

    Token readCharOrLifetime()
    {
        const int startLine = m_line;
        if (peek(1) == '\\') {
            return readCharLiteral(startLine, 0);
        }
        const unsigned char next = static_cast<unsigned char>(peek(1));
        const size_t length = utf8Length(next);
        if (next != '\0' && peek(1 + length) == '\'') {
            const std::string text = m_text.substr(m_pos, length + 2);
            m_pos += length + 2;
            return Token{TokenKind::Char, text, startLine};
        }
        if (isIdentStart(next)) {
            const size_t start = m_pos;
            ++m_pos;
            while (m_pos < m_text.size() && isIdentChar(static_cast<unsigned char>(m_text[m_pos]))) {
                ++m_pos;
            }
            return Token{TokenKind::Lifetime, m_text.substr(start, m_pos - start), startLine};
        }
        throw ScanError({}, startLine, "unterminated character literal");
    }

    Token readIdentifier()
    {
        const size_t start = m_pos;
        while (m_pos < m_text.size() && isIdentChar(static_cast<unsigned char>(m_text[m_pos]))) {
            ++m_pos;
        }
        return Token{TokenKind::Identifier, m_text.substr(start, m_pos - start), m_line};
    }

    Token readNumber()
    {
        const size_t start = m_pos;
        while (m_pos < m_text.size()) {
            const unsigned char c = static_cast<unsigned char>(m_text[m_pos]);
            if (isIdentChar(c)) {
                ++m_pos;
                continue;
            }
            if (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
                ++m_pos;
                continue;
            }
            break;
        }
        return Token{TokenKind::Number, m_text.substr(start, m_pos - start), m_line};
    }

    Token readPunct()
    {
        const std::string_view rest(m_text.data() + m_pos, m_text.size() - m_pos);
        for (const auto &punct : kTwoCharPuncts) {
            if (rest.substr(0, 2) == punct) {
                m_pos += 2;
                return Token{TokenKind::Punct, std::string(punct), m_line};
            }
        }
        const std::string text(1, m_text[m_pos]);
        ++m_pos;
        return Token{TokenKind::Punct, text, m_line};
    }

    const std::string &m_text;
    size_t m_pos = 0;
    int m_line = 1;
};

char closerFor(const std::string &opener)
{
    if (opener == "(") {
        return ')';
    }
    if (opener == "[") {
        return ']';
    }
    return '}';
}

std::vector<size_t> balanceDelimiters(const std::vector<Token> &tokens)
{
    std::vector<size_t> partner(tokens.size(), kNoPartner);
    std::vector<size_t> open;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token &token = tokens[i];
        if (token.kind != TokenKind::Punct) {
            continue;
        }
        if (token.text == "(" || token.text == "[" || token.text == "{") {
            open.push_back(i);
            continue;
        }
        if (token.text == ")" || token.text == "]" || token.text == "}") {
            if (open.empty() || closerFor(tokens[open.back()].text) != token.text[0]) {
                throw ScanError({}, token.line, "unmatched '" + token.text + "'");
            }
            partner[open.back()] = i;
            partner[i] = open.back();
            open.pop_back();
        }
    }
    if (!open.empty()) {
        const Token &unclosed = tokens[open.back()];
        throw ScanError({}, unclosed.line, "unclosed '" + unclosed.text + "'");
    }
    return partner;
}

bool isWordLike(const Token &token)
{
    return token.kind != TokenKind::Punct;
}

bool isSpacedKeyword(const std::string &word)
{
    static const std::array<std::string_view, 15> keywords = {
        "mut", "dyn", "impl", "const", "unsafe", "extern", "where", "for",
        "as", "in", "move", "ref", "async", "static", "let",
    };
    for (const auto &keyword : keywords) {
        if (word == keyword) {
            return true;
        }
    }
    return false;
}

bool needsSpace(const Token &prev, const Token &next)
{
    const std::string &p = prev.text;
    const std::string &n = next.text;
    if (next.kind == TokenKind::Punct) {
        if (n == "->" || n == "=>" || n == "=" || n == "+" || n == "{" || n == "}") {
            return true;
        }
        if (n == "," || n == ";" || n == ")" || n == "]" || n == ">" || n == "."
            || n == "?" || n == ":" || n == "::") {
            return false;
        }
    }
    if (prev.kind == TokenKind::Punct) {
        if (p == "," || p == ";" || p == "->" || p == "=>" || p == "=" || p == "+"
            || p == ":" || p == "{" || p == "}") {
            return true;
        }
        if ((p == ")" || p == "]" || p == ">") && isWordLike(next)) {
            return true;
        }
        return false;
    }
    if (isWordLike(next)) {
        return true;
    }
    if (prev.kind == TokenKind::Identifier && isSpacedKeyword(p) && n != "<" && n != "(") {
        return true;
    }
    return false;
}

class DeclarationWalker {
public:
    explicit DeclarationWalker(ScannedFile &file)
        : m_file(file)
    {
    }

    void walk(size_t begin, size_t end, const std::vector<std::string> &modulePath)
    {
        size_t i = begin;
        while (i < end) {
            i = skipAttributes(i, end);
            if (i >= end) {
                break;
            }
            const size_t itemStart = i;
            size_t cursor = skipVisibility(i, end);
            cursor = skipQualifiers(cursor, end);
            if (cursor >= end) {
                break;
            }

            if (m_file.is(cursor, "mod") && m_file.isIdentifier(cursor + 1)) {
                const std::string name = m_file.tokens[cursor + 1].text;
                if (cursor + 2 < end && m_file.is(cursor + 2, "{")) {
                    const size_t close = m_file.closing(cursor + 2);
                    std::vector<std::string> nested = modulePath;
                    nested.push_back(name);
                    walk(cursor + 3, close, nested);
                    i = close + 1;
                } else {
                    i = skipToItemEnd(cursor, end);
                }
                continue;
            }

            const auto kind = itemKind(cursor, end);
            if (!kind.has_value()) {
                i = skipToItemEnd(cursor, end);
                if (i == itemStart) {
                    ++i;
                }
                continue;
            }

            const size_t itemEnd = skipToItemEnd(cursor, end);
            Declaration declaration;
            declaration.kind = *kind;
            declaration.begin = itemStart;
            declaration.end = itemEnd;
            declaration.lineStart = m_file.tokens[itemStart].line;
            declaration.lineEnd = m_file.tokens[itemEnd - 1].line;
            declaration.modulePath = modulePath;
            m_file.declarations.push_back(std::move(declaration));
            i = itemEnd;
        }
    }

private:
    std::optional<DeclarationKind> itemKind(size_t cursor, size_t end) const
    {
        if (m_file.is(cursor, "struct")) {
            return DeclarationKind::Struct;
        }
        if (m_file.is(cursor, "enum")) {
            return DeclarationKind::Enum;
        }
        if (m_file.is(cursor, "union") && cursor + 1 < end && m_file.isIdentifier(cursor + 1)) {
            return DeclarationKind::Union;
        }
        if (m_file.is(cursor, "trait")) {
            return DeclarationKind::Trait;
        }
        if (m_file.is(cursor, "impl")) {
            return DeclarationKind::Impl;
        }
        if (m_file.is(cursor, "use")) {
            return DeclarationKind::Use;
        }
        if (m_file.is(cursor, "extern") && cursor + 1 < end && m_file.is(cursor + 1, "crate")) {
            return DeclarationKind::ExternCrate;
        }
        return std::nullopt;
    }

    size_t skipAttributes(size_t i, size_t end) const
    {
        while (i < end && m_file.is(i, "#")) {
            size_t open = i + 1;
            if (open < end && m_file.is(open, "!")) {
                ++open;
            }
            if (open >= end || !m_file.is(open, "[")) {
                return i;
            }
            i = m_file.closing(open) + 1;
        }
        return i;
    }

    size_t skipVisibility(size_t i, size_t end) const
    {
        if (i < end && m_file.is(i, "pub")) {
            ++i;
            if (i < end && m_file.is(i, "(")) {
                i = m_file.closing(i) + 1;
            }
        }
        return i;
    }

    size_t skipQualifiers(size_t i, size_t end) const
    {
        while (i < end) {
            if (m_file.is(i, "unsafe") || m_file.is(i, "default") || m_file.is(i, "auto")
                || m_file.is(i, "async")) {
                ++i;
                continue;
            }
            if (m_file.is(i, "extern") && i + 1 < end
                && m_file.tokens[i + 1].kind == TokenKind::String) {
                i += 2;
                continue;
            }
            break;
        }
        return i;
    }

    // Ends after the item's body block or terminating semicolon.
    size_t skipToItemEnd(size_t i, size_t end) const
    {
        while (i < end) {
            const Token &token = m_file.tokens[i];
            if (token.kind == TokenKind::Punct) {
                if (token.text == "{") {
                    const size_t close = m_file.closing(i);
                    // Tuple-like trailing `;` is not part of a braced item.
                    return close + 1;
                }
                if (token.text == "(" || token.text == "[") {
                    i = m_file.closing(i) + 1;
                    continue;
                }
                if (token.text == ";") {
                    return i + 1;
                }
                if (token.text == "}" || token.text == ")" || token.text == "]") {
                    return i + 1;
                }
            }
            ++i;
        }
        return end;
    }

    ScannedFile &m_file;
};

} // namespace

bool ScannedFile::is(size_t index, const char *text) const
{
    return index < tokens.size() && tokens[index].kind != TokenKind::String
        && tokens[index].kind != TokenKind::Char && tokens[index].text == text;
}

bool ScannedFile::isIdentifier(size_t index) const
{
    return index < tokens.size() && tokens[index].kind == TokenKind::Identifier;
}

size_t ScannedFile::closing(size_t index) const
{
    return partner[index];
}

size_t ScannedFile::skipAngles(size_t index, size_t end) const
{
    if (!is(index, "<")) {
        return index;
    }
    int depth = 0;
    size_t i = index;
    while (i < end) {
        if (is(i, "<")) {
            ++depth;
        } else if (is(i, ">")) {
            --depth;
            if (depth == 0) {
                return i + 1;
            }
        } else if (is(i, "(") || is(i, "[") || is(i, "{")) {
            i = closing(i);
        }
        ++i;
    }
    return end;
}

std::string ScannedFile::join(size_t begin, size_t end) const
{
    std::string result;
    for (size_t i = begin; i < end && i < tokens.size(); ++i) {
        if (i > begin && needsSpace(tokens[i - 1], tokens[i])) {
            result += ' ';
        }
        result += tokens[i].text;
    }
    return result;
}

bool isRustKeyword(const std::string &word)
{
    static const std::array<std::string_view, 38> keywords = {
        "as", "async", "await", "break", "const", "continue", "crate", "dyn",
        "else", "enum", "extern", "false", "fn", "for", "if", "impl", "in",
        "let", "loop", "match", "mod", "move", "mut", "pub", "ref", "return",
        "self", "Self", "static", "struct", "super", "trait", "true", "type",
        "unsafe", "use", "where", "while",
    };
    for (const auto &keyword : keywords) {
        if (word == keyword) {
            return true;
        }
    }
    return false;
}

ScannedFile scanSource(const std::string &text)
{
    ScannedFile file;
    Lexer lexer(text);
    file.tokens = lexer.run();
    file.partner = balanceDelimiters(file.tokens);

    DeclarationWalker walker(file);
    walker.walk(0, file.tokens.size(), {});
    return file;
}

} // namespace archscope
