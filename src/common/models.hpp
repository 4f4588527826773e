#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace archscope {

// Provenance only: never part of an entity's identity or structural value.
struct SourceLocation {
    std::string file;
    int lineStart = 0;
    int lineEnd = 0;

    bool operator==(const SourceLocation &) const = default;
};

struct FieldDefinition {
    std::string name;
    std::string typeText;

    bool operator==(const FieldDefinition &) const = default;
};

struct TypeDefinition {
    std::string name;
    // module::Name, the identity used by the registry, the diff and the graph.
    std::string qualifiedName;
    TypeKind kind = TypeKind::Struct;
    Visibility visibility = Visibility::Private;
    std::vector<FieldDefinition> fields;
    SourceLocation location;

    bool operator==(const TypeDefinition &) const = default;
};

struct CallSite {
    std::string callee;
    // Empty until the resolution pass finds the target type.
    std::optional<std::string> target;
    int line = 0;

    bool operator==(const CallSite &) const = default;
};

struct Method {
    std::string name;
    std::string signature;
    std::vector<CallSite> calls;

    bool operator==(const Method &) const = default;
};

struct ImplBlock {
    // Target path as written in the impl header, generics stripped.
    std::string targetType;
    std::optional<std::string> traitName;
    std::vector<Method> methods;
    SourceLocation location;
    // Inline module the block sits in, relative to the file's module
    // ("tests::helpers"). Empty at file level.
    std::string scope;

    bool operator==(const ImplBlock &) const = default;
};

struct Import {
    std::string path;
    std::optional<std::string> alias;
    // A use declaration only binds names in its own module.
    std::string scope;

    bool operator==(const Import &) const = default;
};

struct SourceUnit {
    std::string path;
    std::string modulePath;
    std::vector<TypeDefinition> types;
    std::vector<ImplBlock> impls;
    std::vector<Import> imports;

    bool operator==(const SourceUnit &) const = default;
};

struct ArchitectureDiff {
    struct ChangedField {
        std::string path;
        nlohmann::json before;
        nlohmann::json after;
    };

    struct Modification {
        nlohmann::json before;
        nlohmann::json after;
        std::vector<ChangedField> changedFields;
    };

    std::string snapshotAId;
    std::string snapshotBId;
    DiffGranularity granularity = DiffGranularity::Type;

    std::map<std::string, nlohmann::json> added;
    std::map<std::string, nlohmann::json> removed;
    std::map<std::string, Modification> modified;
    std::set<std::string> unchanged;

    bool isEmpty() const
    {
        return added.empty() && removed.empty() && modified.empty();
    }
};

// Sorts a unit into its canonical order so that semantically identical units
// compare and serialize identically regardless of declaration order.
void canonicalize(SourceUnit &unit);

// Import path segments, e.g. "crate::a::{b}" already expanded to "crate::a::b".
std::vector<std::string> splitPath(const std::string &path);
std::string joinPath(const std::vector<std::string> &segments);

} // namespace archscope
