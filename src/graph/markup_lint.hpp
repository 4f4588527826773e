#pragma once

#include <string>
#include <vector>

#include "common/enums.hpp"

namespace archscope {

// Mermaid header line emitted for a diagram mode.
std::string diagramHeader(DiagramMode mode);

// Structural checks on generated markup: header present, blocks balanced,
// quotes closed, ids well formed and every edge endpoint declared.
// Returns one message per problem; empty means the markup is usable.
std::vector<std::string> lintMarkup(const std::string &markup, DiagramMode mode);

// Throws RenderMarkupError listing every problem lintMarkup() finds.
void validateMarkup(const std::string &markup, DiagramMode mode);

} // namespace archscope
