#pragma once

#include <map>
#include <string>

#include "common/enums.hpp"
#include "graph/relationship_graph.hpp"

namespace archscope {

// "crate::a::Widget" -> "crate_a_Widget"
std::string sanitizeId(const std::string &qualifiedName);

// Stable, collision-free diagram ids for every node of a graph.
std::map<std::string, std::string> assignNodeIds(const RelationshipGraph &graph);

/**
 * Renders a graph as Mermaid markup.
 *
 * Class and state modes emit every node and one line per edge. Connections
 * mode renders abbreviate(graph) and leaves out nodes without edges.
 * Entity mode renders structs and field containment only. The result is
 * linted before it is returned; RenderMarkupError means the graph held
 * something that cannot be expressed.
 */
std::string renderDiagram(const RelationshipGraph &graph, DiagramMode mode);

} // namespace archscope
