#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace archscope {

enum class TokenKind {
    Identifier,
    Lifetime,
    Punct,
    String,
    Char,
    Number
};

struct Token {
    TokenKind kind = TokenKind::Punct;
    std::string text;
    int line = 0;
};

enum class DeclarationKind {
    Struct,
    Enum,
    Union,
    Trait,
    Impl,
    Use,
    ExternCrate
};

// One top-level item. Token indices are half-open: [begin, end).
// begin points at the visibility keyword or the item keyword, after any
// attributes.
struct Declaration {
    DeclarationKind kind = DeclarationKind::Struct;
    size_t begin = 0;
    size_t end = 0;
    int lineStart = 0;
    int lineEnd = 0;
    // Segments of enclosing inline `mod name { ... }` blocks.
    std::vector<std::string> modulePath;
};

struct ScannedFile {
    std::vector<Token> tokens;
    // For every opening or closing delimiter, the index of its partner;
    // npos for every other token.
    std::vector<size_t> partner;
    std::vector<Declaration> declarations;

    bool is(size_t index, const char *text) const;
    bool isIdentifier(size_t index) const;
    // Index of the closing delimiter for the opener at `index`.
    size_t closing(size_t index) const;
    // Skips a `<...>` group starting at `index`; returns the index after it.
    size_t skipAngles(size_t index, size_t end) const;
    // Token text joined with canonical spacing; comments and layout are lost.
    std::string join(size_t begin, size_t end) const;
};

/**
 * Scan Rust source text into tokens and top-level declarations.
 *
 * Delimiters are balanced across the whole file so method bodies can be
 * isolated as opaque token ranges. Unknown items are skipped. Throws
 * ScanError (with an empty file name) on an unterminated string, char or
 * block comment, or on an unmatched delimiter.
 */
ScannedFile scanSource(const std::string &text);

bool isRustKeyword(const std::string &word);

} // namespace archscope
