#include "graph/markup_lint.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#include "common/errors.hpp"

namespace archscope {

namespace {

const std::vector<std::string> kArrows = {"-->", "..|>", "*--", "..>", "||--"};

std::string trim(const std::string &text)
{
    const size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool startsWith(const std::string &text, const std::string &prefix)
{
    return text.rfind(prefix, 0) == 0;
}

bool isValidId(const std::string &id)
{
    if (id.empty() || !(std::isalpha(static_cast<unsigned char>(id.front())) || id.front() == '_')) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::vector<std::string> words(const std::string &text)
{
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        result.push_back(word);
    }
    return result;
}

// Text up to the first of the given delimiters.
std::string takeUntil(const std::string &text, const std::string &delimiters)
{
    const size_t end = text.find_first_of(delimiters);
    return end == std::string::npos ? text : text.substr(0, end);
}

bool hasArrow(const std::string &line)
{
    return std::any_of(kArrows.begin(), kArrows.end(), [&line](const std::string &arrow) {
        return line.find(arrow) != std::string::npos;
    });
}

} // namespace

std::string diagramHeader(DiagramMode mode)
{
    switch (mode) {
    case DiagramMode::Class:
        return "classDiagram";
    case DiagramMode::State:
        return "stateDiagram-v2";
    case DiagramMode::Connections:
        return "graph LR";
    case DiagramMode::Entity:
        return "erDiagram";
    }
    return "classDiagram";
}

std::vector<std::string> lintMarkup(const std::string &markup, DiagramMode mode)
{
    std::vector<std::string> problems;
    std::set<std::string> declared;
    std::vector<std::pair<int, std::string>> endpoints;

    std::istringstream in(markup);
    std::string raw;
    int lineNumber = 0;
    bool headerSeen = false;
    int depth = 0;

    while (std::getline(in, raw)) {
        ++lineNumber;
        const std::string line = trim(raw);
        if (line.empty() || startsWith(line, "%%")) {
            continue;
        }
        const std::string where = "line " + std::to_string(lineNumber) + ": ";
        if (!headerSeen) {
            if (line != diagramHeader(mode)) {
                problems.push_back(where + "expected header '" + diagramHeader(mode) + "'");
            }
            headerSeen = true;
            continue;
        }
        if (std::count(line.begin(), line.end(), '"') % 2 != 0) {
            problems.push_back(where + "unbalanced quotes");
        }

        if (depth > 0) {
            if (line == "}") {
                --depth;
            } else if (line.find('{') != std::string::npos || line.find('}') != std::string::npos) {
                problems.push_back(where + "brace inside block");
            }
            continue;
        }
        if (line == "}") {
            problems.push_back(where + "unexpected '}'");
            continue;
        }

        const bool opensBlock = line.size() > 1 && line.back() == '{'
            && line[line.size() - 2] == ' ';
        if (opensBlock) {
            ++depth;
        }

        std::string declaredId;
        bool isDeclaration = true;
        if (mode == DiagramMode::Class && startsWith(line, "class ")) {
            declaredId = takeUntil(line.substr(6), "[ {");
        } else if (mode == DiagramMode::State && startsWith(line, "state ")) {
            const size_t as = line.rfind(" as ");
            declaredId = as == std::string::npos ? std::string() : trim(line.substr(as + 4));
        } else if (mode == DiagramMode::Connections && !hasArrow(line)
                   && line.find('[') != std::string::npos) {
            declaredId = line.substr(0, line.find('['));
        } else if (mode == DiagramMode::Entity && (opensBlock || !hasArrow(line))) {
            declaredId = words(line).front();
        } else {
            isDeclaration = false;
        }

        if (isDeclaration) {
            if (!isValidId(declaredId)) {
                problems.push_back(where + "invalid node id '" + declaredId + "'");
            }
            declared.insert(declaredId);
            continue;
        }

        if (!hasArrow(line)) {
            problems.push_back(where + "unrecognized statement");
            continue;
        }
        const size_t caption = line.find(" : ");
        const auto parts = words(caption == std::string::npos ? line : line.substr(0, caption));
        if (parts.size() < 3) {
            problems.push_back(where + "incomplete edge");
            continue;
        }
        endpoints.emplace_back(lineNumber, parts.front());
        endpoints.emplace_back(lineNumber, parts.back());
    }

    if (!headerSeen) {
        problems.push_back("missing header '" + diagramHeader(mode) + "'");
    }
    if (depth != 0) {
        problems.push_back("unclosed block at end of markup");
    }

    for (const auto &[number, id] : endpoints) {
        const std::string where = "line " + std::to_string(number) + ": ";
        if (!isValidId(id)) {
            problems.push_back(where + "invalid edge endpoint '" + id + "'");
        } else if (mode != DiagramMode::Entity && !declared.contains(id)) {
            problems.push_back(where + "undeclared edge endpoint '" + id + "'");
        }
    }
    return problems;
}

void validateMarkup(const std::string &markup, DiagramMode mode)
{
    const auto problems = lintMarkup(markup, mode);
    if (problems.empty()) {
        return;
    }
    std::string message = "invalid diagram markup:";
    for (const auto &problem : problems) {
        message += "\n  " + problem;
    }
    throw RenderMarkupError(message);
}

} // namespace archscope
