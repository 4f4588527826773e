#include "graph/diagram_renderer.hpp"

#include <cctype>
#include <set>
#include <sstream>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "graph/markup_lint.hpp"

namespace archscope {

namespace {

const std::string kIndent = "    ";

bool isIdChar(unsigned char c)
{
    return std::isalnum(c) || c == '_';
}

std::string sanitizeLabel(const std::string &text)
{
    std::string result;
    for (const char c : text) {
        if (c == '"') {
            result += '\'';
        } else if (c == '\n' || c == '\r') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

// Class member text: generics use ~T~, braces and semicolons would end
// the class block or the statement.
std::string sanitizeMember(const std::string &text)
{
    std::string result;
    for (const char c : text) {
        switch (c) {
        case '<':
        case '>':
            result += '~';
            break;
        case '{':
            result += '(';
            break;
        case '}':
            result += ')';
            break;
        case ';':
            result += ',';
            break;
        case '"':
            result += '\'';
            break;
        default:
            result += c;
        }
    }
    return result;
}

std::string sanitizeCaption(const std::string &text)
{
    std::string result;
    for (const char c : text) {
        if (c == '"' || c == ':' || c == ';' || c == '|' || c == '{' || c == '}') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

// erDiagram attribute types and names: word characters only.
std::string sanitizeWord(const std::string &text, const std::string &fallback)
{
    std::string result;
    for (const char c : text) {
        if (isIdChar(static_cast<unsigned char>(c))) {
            result += c;
        } else if (!result.empty() && result.back() != '_') {
            result += '_';
        }
    }
    while (!result.empty() && result.back() == '_') {
        result.pop_back();
    }
    if (result.empty()) {
        return fallback;
    }
    if (std::isdigit(static_cast<unsigned char>(result.front()))) {
        result = "f_" + result;
    }
    return result;
}

// "pub fn new(x: u8) -> Self" -> "+new(x: u8) Self"
std::string methodMember(const std::string &signature)
{
    const size_t fnPos = signature.find("fn ");
    if (fnPos == std::string::npos) {
        return sanitizeMember(signature);
    }
    const bool isPublic = signature.rfind("pub", 0) == 0;
    size_t nameEnd = fnPos + 3;
    while (nameEnd < signature.size() && isIdChar(static_cast<unsigned char>(signature[nameEnd]))) {
        ++nameEnd;
    }
    const std::string name = signature.substr(fnPos + 3, nameEnd - fnPos - 3);

    std::string params;
    std::string returned;
    const size_t open = signature.find('(', nameEnd);
    if (open != std::string::npos) {
        int depth = 0;
        size_t close = open;
        for (; close < signature.size(); ++close) {
            if (signature[close] == '(') {
                ++depth;
            } else if (signature[close] == ')' && --depth == 0) {
                break;
            }
        }
        params = signature.substr(open + 1, close > open ? close - open - 1 : 0);
        const size_t arrow = signature.find("->", close);
        if (arrow != std::string::npos) {
            returned = signature.substr(arrow + 2);
            const size_t where = returned.find(" where ");
            if (where != std::string::npos) {
                returned = returned.substr(0, where);
            }
            const size_t first = returned.find_first_not_of(' ');
            returned = first == std::string::npos ? std::string() : returned.substr(first);
        }
    }

    std::string member = (isPublic ? "+" : "-") + name + "(" + params + ")";
    if (!returned.empty()) {
        member += " " + returned;
    }
    return sanitizeMember(member);
}

std::string classArrow(const GraphEdge &edge)
{
    switch (edge.kind) {
    case EdgeKind::Calls:
        return "-->";
    case EdgeKind::Implements:
        return "..|>";
    case EdgeKind::ContainsField:
        return edge.many ? "\"1\" *-- \"*\"" : "*--";
    case EdgeKind::StateTransition:
        return "..>";
    }
    return "-->";
}

std::string classCaption(const GraphEdge &edge)
{
    switch (edge.kind) {
    case EdgeKind::Calls:
        return edge.via.empty() ? edge.label : edge.label + " calls " + edge.via;
    case EdgeKind::Implements:
        return {};
    case EdgeKind::ContainsField:
    case EdgeKind::StateTransition:
        return edge.label;
    }
    return edge.label;
}

void renderClass(const RelationshipGraph &graph,
                 const std::map<std::string, std::string> &ids,
                 std::ostringstream &out)
{
    for (const auto &[name, node] : graph.nodes()) {
        out << kIndent << "class " << ids.at(name) << "[\"" << sanitizeLabel(node.label)
            << "\"]";
        if (node.fields.empty() && node.methods.empty() && node.kind == TypeKind::Struct) {
            out << "\n";
            continue;
        }
        out << " {\n";
        if (node.kind == TypeKind::Enum) {
            out << kIndent << kIndent << "<<enumeration>>\n";
        } else if (node.kind == TypeKind::Trait) {
            out << kIndent << kIndent << "<<interface>>\n";
        }
        for (const auto &field : node.fields) {
            std::string member = "+" + field.name;
            if (node.kind == TypeKind::Enum) {
                member += field.typeText.rfind('=', 0) == 0 ? " " + field.typeText
                                                             : field.typeText;
            } else if (!field.typeText.empty()) {
                member += ": " + field.typeText;
            }
            out << kIndent << kIndent << sanitizeMember(member) << "\n";
        }
        for (const auto &signature : node.methods) {
            out << kIndent << kIndent << methodMember(signature) << "\n";
        }
        out << kIndent << "}\n";
    }

    for (const auto &edge : graph.edges()) {
        out << kIndent << ids.at(edge.source) << " " << classArrow(edge) << " "
            << ids.at(edge.target);
        const std::string caption = sanitizeCaption(classCaption(edge));
        if (!caption.empty()) {
            out << " : " << caption;
        }
        out << "\n";
    }
}

void renderState(const RelationshipGraph &graph,
                 const std::map<std::string, std::string> &ids,
                 std::ostringstream &out)
{
    for (const auto &[name, node] : graph.nodes()) {
        out << kIndent << "state \"" << sanitizeLabel(node.label) << "\" as " << ids.at(name)
            << "\n";
    }
    for (const auto &edge : graph.edges()) {
        std::string caption = toEdgeKindString(edge.kind);
        if (!edge.label.empty()) {
            caption += " " + edge.label;
        }
        out << kIndent << ids.at(edge.source) << " --> " << ids.at(edge.target) << " : "
            << sanitizeCaption(caption) << "\n";
    }
}

void renderConnections(const RelationshipGraph &graph, std::ostringstream &out)
{
    const RelationshipGraph collapsed = abbreviate(graph);
    const auto ids = assignNodeIds(collapsed);
    const std::set<std::string> connected = collapsed.connectedNodes();

    for (const auto &[name, node] : collapsed.nodes()) {
        if (connected.contains(name)) {
            out << kIndent << ids.at(name) << "[\"" << sanitizeLabel(node.label) << "\"]\n";
        }
    }
    for (const auto &edge : collapsed.edges()) {
        out << kIndent << ids.at(edge.source) << " -->";
        const std::string caption = sanitizeCaption(edge.label);
        if (!caption.empty()) {
            out << "|\"" << caption << "\"|";
        }
        out << " " << ids.at(edge.target) << "\n";
    }
}

void renderEntity(const RelationshipGraph &graph,
                  const std::map<std::string, std::string> &ids,
                  std::ostringstream &out)
{
    const auto containment = graph.edgesOfKind(EdgeKind::ContainsField);
    // Entities without attributes are declared by their relationships.
    for (const auto &[name, node] : graph.nodes()) {
        if (node.kind != TypeKind::Struct || node.fields.empty()) {
            continue;
        }
        out << kIndent << ids.at(name) << " {\n";
        for (const auto &field : node.fields) {
            out << kIndent << kIndent << sanitizeWord(field.typeText, "unit") << " "
                << sanitizeWord(field.name, "field") << "\n";
        }
        out << kIndent << "}\n";
    }
    for (const auto &edge : containment) {
        out << kIndent << ids.at(edge.source) << (edge.many ? " ||--o{ " : " ||--|| ")
            << ids.at(edge.target) << " : \"" << sanitizeCaption(edge.label) << "\"\n";
    }
}

} // namespace

std::string sanitizeId(const std::string &qualifiedName)
{
    std::string id;
    for (size_t i = 0; i < qualifiedName.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(qualifiedName[i]);
        if (c == ':' && i + 1 < qualifiedName.size() && qualifiedName[i + 1] == ':') {
            id += '_';
            ++i;
        } else if (isIdChar(c)) {
            id += static_cast<char>(c);
        } else {
            id += '_';
        }
    }
    if (id.empty() || std::isdigit(static_cast<unsigned char>(id.front())) || id == "end") {
        id = "n_" + id;
    }
    return id;
}

std::map<std::string, std::string> assignNodeIds(const RelationshipGraph &graph)
{
    std::map<std::string, std::string> ids;
    std::set<std::string> used;
    for (const auto &[name, node] : graph.nodes()) {
        const std::string base = sanitizeId(name);
        std::string id = base;
        for (int suffix = 2; used.contains(id); ++suffix) {
            id = base + "_" + std::to_string(suffix);
        }
        used.insert(id);
        ids.emplace(name, id);
    }
    return ids;
}

std::string renderDiagram(const RelationshipGraph &graph, DiagramMode mode)
{
    std::ostringstream out;
    out << diagramHeader(mode) << "\n";

    const auto ids = assignNodeIds(graph);
    switch (mode) {
    case DiagramMode::Class:
        renderClass(graph, ids, out);
        break;
    case DiagramMode::State:
        renderState(graph, ids, out);
        break;
    case DiagramMode::Connections:
        renderConnections(graph, out);
        break;
    case DiagramMode::Entity:
        renderEntity(graph, ids, out);
        break;
    }

    const std::string markup = out.str();
    validateMarkup(markup, mode);

    ALOG_DEBUG(QStringLiteral("DiagramRenderer"),
               QStringLiteral("renderDiagram"),
               QStringLiteral("markup_rendered"),
               QStringLiteral("diagram_requested"),
               QStringLiteral("mermaid"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"mode", toDiagramModeString(mode)},
                               {"nodes", graph.nodes().size()},
                               {"edges", graph.edges().size()},
                               {"bytes", markup.size()}}));
    return markup;
}

} // namespace archscope
