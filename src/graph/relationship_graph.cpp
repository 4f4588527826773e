#include "graph/relationship_graph.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "extract/name_resolver.hpp"

namespace archscope {

namespace {

bool inList(std::string_view value, const std::string_view *begin, const std::string_view *end)
{
    return std::find(begin, end, value) != end;
}

bool isWrapper(std::string_view name)
{
    static const std::array<std::string_view, 11> wrappers = {
        "Option", "Result", "Box", "Arc", "Rc", "RefCell", "Cell",
        "Mutex", "RwLock", "Cow", "Pin",
    };
    return inList(name, wrappers.data(), wrappers.data() + wrappers.size());
}

bool isCollection(std::string_view name)
{
    static const std::array<std::string_view, 7> collections = {
        "Vec", "HashMap", "HashSet", "BTreeMap", "BTreeSet", "VecDeque", "LinkedList",
    };
    return inList(name, collections.data(), collections.data() + collections.size());
}

bool isTypeKeyword(std::string_view name)
{
    static const std::array<std::string_view, 10> keywords = {
        "mut", "dyn", "impl", "const", "fn", "unsafe", "extern", "where", "for", "Self",
    };
    return inList(name, keywords.data(), keywords.data() + keywords.size());
}

std::string lastSegment(const std::string &path)
{
    const size_t pos = path.rfind("::");
    return pos == std::string::npos ? path : path.substr(pos + 2);
}

std::string trim(const std::string &text)
{
    const size_t first = text.find_first_not_of(' ');
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(' ');
    return text.substr(first, last - first + 1);
}

// "pub fn new(x: u8) -> Self" -> "new"
std::string methodNameOf(const std::string &signature)
{
    size_t pos = 0;
    while ((pos = signature.find("fn ", pos)) != std::string::npos) {
        if (pos == 0 || signature[pos - 1] == ' ') {
            size_t start = pos + 3;
            size_t end = start;
            while (end < signature.size()
                   && (std::isalnum(static_cast<unsigned char>(signature[end]))
                       || signature[end] == '_')) {
                ++end;
            }
            return signature.substr(start, end - start);
        }
        pos += 3;
    }
    return {};
}

// Strips one layer of `Wrapper<...>` keeping the first argument.
bool unwrapOnce(std::string &text)
{
    for (const char *wrapper : {"Option<", "Result<", "Box<"}) {
        const std::string prefix(wrapper);
        if (text.rfind(prefix, 0) != 0 || text.back() != '>') {
            continue;
        }
        const std::string inner = text.substr(prefix.size(), text.size() - prefix.size() - 1);
        int depth = 0;
        size_t cut = inner.size();
        for (size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '<' || inner[i] == '(' || inner[i] == '[') {
                ++depth;
            } else if (inner[i] == '>' || inner[i] == ')' || inner[i] == ']') {
                --depth;
            } else if (inner[i] == ',' && depth == 0) {
                cut = i;
                break;
            }
        }
        text = trim(inner.substr(0, cut));
        return true;
    }
    return false;
}

bool isTransition(const GraphNode &target, const std::string &via)
{
    if (via.empty()) {
        return false;
    }
    // Tuple struct or variant construction.
    if (via == "Self" || via == target.label) {
        return true;
    }
    if (target.kind == TypeKind::Enum) {
        for (const auto &variant : target.fields) {
            if (variant.name == via) {
                return true;
            }
        }
    }
    if (isConstructorName(via)) {
        return true;
    }
    for (const auto &signature : target.methods) {
        if (methodNameOf(signature) == via && returnsType(signature, target.label)) {
            return true;
        }
    }
    return false;
}

} // namespace

bool RelationshipGraph::addNode(GraphNode node)
{
    const std::string name = node.qualifiedName;
    return m_nodes.emplace(name, std::move(node)).second;
}

bool RelationshipGraph::addEdge(GraphEdge edge)
{
    if (!hasNode(edge.source) || !hasNode(edge.target)) {
        return false;
    }
    m_edges.insert(std::move(edge));
    return true;
}

bool RelationshipGraph::hasNode(const std::string &qualifiedName) const
{
    return m_nodes.contains(qualifiedName);
}

const GraphNode *RelationshipGraph::findNode(const std::string &qualifiedName) const
{
    const auto it = m_nodes.find(qualifiedName);
    return it == m_nodes.end() ? nullptr : &it->second;
}

std::vector<GraphEdge> RelationshipGraph::edgesOfKind(EdgeKind kind) const
{
    std::vector<GraphEdge> result;
    for (const auto &edge : m_edges) {
        if (edge.kind == kind) {
            result.push_back(edge);
        }
    }
    return result;
}

std::set<std::string> RelationshipGraph::connectedNodes() const
{
    std::set<std::string> connected;
    for (const auto &edge : m_edges) {
        connected.insert(edge.source);
        connected.insert(edge.target);
    }
    return connected;
}

std::vector<TypeReference> typeReferences(const std::string &typeText)
{
    std::vector<TypeReference> references;
    // One entry per open <, [ or ( : whether the enclosed types are many.
    std::vector<bool> manyStack;
    const auto currentMany = [&manyStack]() {
        return !manyStack.empty() && manyStack.back();
    };

    size_t i = 0;
    while (i < typeText.size()) {
        const unsigned char c = static_cast<unsigned char>(typeText[i]);
        if (c == '\'') {
            ++i;
            while (i < typeText.size()
                   && (std::isalnum(static_cast<unsigned char>(typeText[i])) || typeText[i] == '_')) {
                ++i;
            }
            continue;
        }
        if (c == '-' && i + 1 < typeText.size() && typeText[i + 1] == '>') {
            i += 2;
            continue;
        }
        if (c == '<' || c == '(') {
            manyStack.push_back(currentMany());
            ++i;
            continue;
        }
        if (c == '[') {
            manyStack.push_back(true);
            ++i;
            continue;
        }
        if (c == '>' || c == ')' || c == ']') {
            if (!manyStack.empty()) {
                manyStack.pop_back();
            }
            ++i;
            continue;
        }
        if (!(std::isalpha(c) || c == '_')) {
            ++i;
            continue;
        }

        const size_t start = i;
        while (i < typeText.size()) {
            const unsigned char d = static_cast<unsigned char>(typeText[i]);
            if (std::isalnum(d) || d == '_') {
                ++i;
            } else if (d == ':' && i + 1 < typeText.size() && typeText[i + 1] == ':') {
                i += 2;
            } else {
                break;
            }
        }
        const std::string path = typeText.substr(start, i - start);
        const std::string name = lastSegment(path);

        size_t next = i;
        while (next < typeText.size() && typeText[next] == ' ') {
            ++next;
        }
        const bool hasArguments = next < typeText.size() && typeText[next] == '<';
        if (hasArguments) {
            manyStack.push_back(currentMany() || isCollection(name));
            i = next + 1;
        }
        if (isWrapper(name) || isCollection(name) || isTypeKeyword(name) || name.empty()) {
            continue;
        }
        const bool many = hasArguments ? (manyStack.size() > 1 && manyStack[manyStack.size() - 2])
                                       : currentMany();
        const TypeReference reference{path, many};
        if (std::find(references.begin(), references.end(), reference) == references.end()) {
            references.push_back(reference);
        }
    }
    return references;
}

bool returnsType(const std::string &signature, const std::string &typeName)
{
    const size_t arrow = signature.rfind("->");
    if (arrow == std::string::npos) {
        return false;
    }
    std::string returned = signature.substr(arrow + 2);
    const size_t where = returned.find(" where ");
    if (where != std::string::npos) {
        returned = returned.substr(0, where);
    }
    returned = trim(returned);
    while (unwrapOnce(returned)) {
    }
    if (returned == "Self" || returned == typeName) {
        return true;
    }
    const std::string suffix = "::" + typeName;
    return returned.size() > suffix.size()
        && returned.compare(returned.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isConstructorName(const std::string &method)
{
    if (method == "new" || method == "default" || method == "from" || method == "try_from"
        || method == "build") {
        return true;
    }
    for (const char *prefix : {"new_", "from_", "with_"}) {
        if (method.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

GraphBuildResult buildGraph(const ArchitectureSnapshot &snapshot, const GraphOptions &options)
{
    GraphBuildResult result;

    if (!snapshot.excludedNames.empty()) {
        const std::vector<std::string> names(snapshot.excludedNames.begin(),
                                             snapshot.excludedNames.end());
        if (options.strictDuplicates) {
            throw GraphError(names);
        }
        for (const auto &duplicate : snapshot.duplicates) {
            result.diagnostics.push_back(std::string("excluded from graph: ") + duplicate.what());
        }
        ALOG_WARN(QStringLiteral("GraphBuilder"),
                  QStringLiteral("buildGraph"),
                  QStringLiteral("duplicates_excluded"),
                  QStringLiteral("qualified_name_collision"),
                  QStringLiteral("registry_filter"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"names", names}}));
    }

    const NameResolver resolver(snapshot);

    // Nodes first, with the methods gathered from every impl block.
    std::map<std::string, GraphNode> nodes;
    for (const auto &[name, path] : snapshot.registry) {
        const TypeDefinition *type = snapshot.findType(name);
        if (!type) {
            continue;
        }
        nodes[name] = GraphNode{name, type->name, type->kind, type->fields, {}};
    }
    for (const auto &[path, unit] : snapshot.units) {
        for (const auto &impl : unit.impls) {
            const auto target = resolver.resolveImplTarget(unit, impl);
            if (!target.has_value() || !nodes.contains(*target)) {
                continue;
            }
            auto &methods = nodes[*target].methods;
            for (const auto &method : impl.methods) {
                methods.push_back(method.signature);
            }
        }
    }
    for (auto &[name, node] : nodes) {
        std::sort(node.methods.begin(), node.methods.end());
        node.methods.erase(std::unique(node.methods.begin(), node.methods.end()),
                           node.methods.end());
        result.graph.addNode(node);
    }

    for (const auto &[path, unit] : snapshot.units) {
        for (const auto &impl : unit.impls) {
            const auto target = resolver.resolveImplTarget(unit, impl);
            if (!target.has_value() || !result.graph.hasNode(*target)) {
                for (const auto &method : impl.methods) {
                    result.unresolvedCalls += method.calls.size();
                }
                continue;
            }
            if (const auto trait = resolver.resolveTrait(unit, impl)) {
                result.graph.addEdge(GraphEdge{*target, *trait, EdgeKind::Implements, {}, {}, false});
            }
            for (const auto &method : impl.methods) {
                for (const auto &call : method.calls) {
                    const auto resolution = resolver.resolveCall(unit, call.callee, target,
                                                                 impl.scope);
                    if (!resolution.has_value()) {
                        ++result.unresolvedCalls;
                        continue;
                    }
                    ++result.resolvedCalls;
                    if (resolution->targetType == *target) {
                        continue;
                    }
                    result.graph.addEdge(GraphEdge{*target, resolution->targetType,
                                                   EdgeKind::Calls, method.name,
                                                   resolution->method, false});
                }
            }
        }
    }

    for (const auto &[name, node] : result.graph.nodes()) {
        const SourceUnit *owner = snapshot.findUnit(snapshot.registry.at(name));
        if (!owner || node.kind == TypeKind::Enum) {
            continue;
        }
        const std::string scope = scopeOfType(*owner, name);
        for (const auto &field : node.fields) {
            for (const auto &reference : typeReferences(field.typeText)) {
                const auto resolved = resolver.resolveType(*owner, reference.path, scope);
                if (resolved.has_value()) {
                    result.graph.addEdge(GraphEdge{name, *resolved, EdgeKind::ContainsField,
                                                   field.name, {}, reference.many});
                }
            }
        }
    }

    annotateStateTransitions(result.graph);

    ALOG_INFO(QStringLiteral("GraphBuilder"),
              QStringLiteral("buildGraph"),
              QStringLiteral("graph_built"),
              QStringLiteral("graph_requested"),
              QStringLiteral("registry_resolution"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"nodes", result.graph.nodes().size()},
                              {"edges", result.graph.edges().size()},
                              {"resolvedCalls", result.resolvedCalls},
                              {"unresolvedCalls", result.unresolvedCalls}}));
    return result;
}

void annotateStateTransitions(RelationshipGraph &graph)
{
    for (const auto &edge : graph.edgesOfKind(EdgeKind::Calls)) {
        const GraphNode *target = graph.findNode(edge.target);
        if (target && isTransition(*target, edge.via)) {
            graph.addEdge(GraphEdge{edge.source, edge.target, EdgeKind::StateTransition,
                                    edge.label, edge.via, false});
        }
    }
}

RelationshipGraph abbreviate(const RelationshipGraph &graph)
{
    struct Group {
        EdgeKind kind = EdgeKind::StateTransition;
        std::set<std::string> labels;
        bool many = false;
    };
    std::map<std::pair<std::string, std::string>, Group> groups;
    for (const auto &edge : graph.edges()) {
        Group &group = groups[{edge.source, edge.target}];
        group.kind = std::min(group.kind, edge.kind);
        if (!edge.label.empty()) {
            group.labels.insert(edge.label);
        }
        group.many = group.many || edge.many;
    }

    RelationshipGraph collapsed;
    for (const auto &[name, node] : graph.nodes()) {
        collapsed.addNode(node);
    }
    for (const auto &[endpoints, group] : groups) {
        std::string label;
        for (const auto &part : group.labels) {
            if (!label.empty()) {
                label += ", ";
            }
            label += part;
        }
        collapsed.addEdge(GraphEdge{endpoints.first, endpoints.second, group.kind, label, {},
                                    group.many});
    }
    return collapsed;
}

} // namespace archscope
