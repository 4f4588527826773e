#pragma once

#include <compare>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "common/snapshot.hpp"

namespace archscope {

struct GraphNode {
    std::string qualifiedName;
    std::string label;
    TypeKind kind = TypeKind::Struct;
    std::vector<FieldDefinition> fields;
    // Signatures of every method whose impl block resolves to this type.
    std::vector<std::string> methods;
};

struct GraphEdge {
    std::string source;
    std::string target;
    EdgeKind kind = EdgeKind::Calls;
    // Calling method for calls and transitions, field name for containment.
    std::string label;
    // Callee method on the target, calls and transitions only.
    std::string via;
    // Containment through a collection.
    bool many = false;

    auto operator<=>(const GraphEdge &) const = default;
};

// Directed graph over qualified type names. Every edge's endpoints are
// nodes of the same graph; addEdge() refuses dangling edges.
class RelationshipGraph {
public:
    // Returns false when a node with the same name already exists.
    bool addNode(GraphNode node);
    // Returns false when an endpoint is not a node.
    bool addEdge(GraphEdge edge);

    bool hasNode(const std::string &qualifiedName) const;
    const GraphNode *findNode(const std::string &qualifiedName) const;

    const std::map<std::string, GraphNode> &nodes() const { return m_nodes; }
    const std::set<GraphEdge> &edges() const { return m_edges; }
    std::vector<GraphEdge> edgesOfKind(EdgeKind kind) const;

    // Nodes that are the source or target of at least one edge.
    std::set<std::string> connectedNodes() const;

private:
    std::map<std::string, GraphNode> m_nodes;
    std::set<GraphEdge> m_edges;
};

struct GraphOptions {
    // Throw GraphError instead of building around duplicate names.
    bool strictDuplicates = false;
};

struct GraphBuildResult {
    RelationshipGraph graph;
    std::vector<std::string> diagnostics;
    size_t resolvedCalls = 0;
    // Calls whose callee did not resolve to a known type; no edge is made.
    size_t unresolvedCalls = 0;
};

struct TypeReference {
    std::string path;
    bool many = false;

    bool operator==(const TypeReference &) const = default;
};

// Type paths named by a declared type, seen through references, smart
// pointers, Option/Result and collections. "Vec<Arc<Node>>" -> {Node, many}.
std::vector<TypeReference> typeReferences(const std::string &typeText);

// True when the return type of `signature` is Self or `typeName`, also
// through Option, Result and Box.
bool returnsType(const std::string &signature, const std::string &typeName);

bool isConstructorName(const std::string &method);

/**
 * Builds the relationship graph of a snapshot: one node per registry type,
 * calls edges labeled with the calling method, implements edges for traits
 * that are known types, and containment edges for resolvable field types.
 * State transitions are added afterwards by annotateStateTransitions().
 *
 * Duplicate names in the snapshot become diagnostics, or a GraphError when
 * options.strictDuplicates is set.
 */
GraphBuildResult buildGraph(const ArchitectureSnapshot &snapshot,
                            const GraphOptions &options = GraphOptions());

// Tags calls edges that reach a constructor-like or Self-returning method
// (or a tuple/variant construction) with an extra StateTransition edge.
void annotateStateTransitions(RelationshipGraph &graph);

// Collapses parallel edges between the same (source, target) pair into one.
// The kept kind is the lowest-ranked kind; labels are merged. Idempotent.
RelationshipGraph abbreviate(const RelationshipGraph &graph);

} // namespace archscope
