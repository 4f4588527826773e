#pragma once

namespace archscope {

enum class TypeKind {
    Struct,
    Enum,
    Trait
};

enum class Visibility {
    Private,
    Public,
    Crate,
    Restricted
};

// Declaration order is the rank used when parallel edges are collapsed.
enum class EdgeKind {
    Calls,
    Implements,
    ContainsField,
    StateTransition
};

enum class DiagramMode {
    Class,
    State,
    Connections,
    Entity
};

enum class DiffGranularity {
    Type,
    Method
};

} // namespace archscope
