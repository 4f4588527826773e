#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace archscope {

inline std::string toTypeKindString(TypeKind kind)
{
    switch (kind) {
    case TypeKind::Struct:
        return "struct";
    case TypeKind::Enum:
        return "enum";
    case TypeKind::Trait:
        return "trait";
    }
    return "struct";
}

inline std::string toVisibilityString(Visibility visibility)
{
    switch (visibility) {
    case Visibility::Private:
        return "private";
    case Visibility::Public:
        return "pub";
    case Visibility::Crate:
        return "pub(crate)";
    case Visibility::Restricted:
        return "pub(restricted)";
    }
    return "private";
}

inline std::string toEdgeKindString(EdgeKind kind)
{
    switch (kind) {
    case EdgeKind::Calls:
        return "calls";
    case EdgeKind::Implements:
        return "implements";
    case EdgeKind::ContainsField:
        return "contains";
    case EdgeKind::StateTransition:
        return "transition";
    }
    return "calls";
}

inline std::string toDiagramModeString(DiagramMode mode)
{
    switch (mode) {
    case DiagramMode::Class:
        return "class";
    case DiagramMode::State:
        return "state";
    case DiagramMode::Connections:
        return "connections";
    case DiagramMode::Entity:
        return "entity";
    }
    return "class";
}

inline TypeKind parseTypeKindString(const std::string &value)
{
    if (value == "enum") {
        return TypeKind::Enum;
    }
    if (value == "trait") {
        return TypeKind::Trait;
    }
    return TypeKind::Struct;
}

inline Visibility parseVisibilityString(const std::string &value)
{
    if (value == "pub") {
        return Visibility::Public;
    }
    if (value == "pub(crate)") {
        return Visibility::Crate;
    }
    if (value == "pub(restricted)") {
        return Visibility::Restricted;
    }
    return Visibility::Private;
}

inline std::optional<DiagramMode> parseDiagramModeString(const std::string &value)
{
    if (value == "class") {
        return DiagramMode::Class;
    }
    if (value == "state") {
        return DiagramMode::State;
    }
    if (value == "connections") {
        return DiagramMode::Connections;
    }
    if (value == "entity") {
        return DiagramMode::Entity;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const TypeKind &kind)
{
    j = toTypeKindString(kind);
}

inline void from_json(const nlohmann::json &j, TypeKind &kind)
{
    if (j.is_string()) {
        kind = parseTypeKindString(j.get<std::string>());
    } else {
        kind = TypeKind::Struct;
    }
}

inline void to_json(nlohmann::json &j, const Visibility &visibility)
{
    j = toVisibilityString(visibility);
}

inline void from_json(const nlohmann::json &j, Visibility &visibility)
{
    if (j.is_string()) {
        visibility = parseVisibilityString(j.get<std::string>());
    } else {
        visibility = Visibility::Private;
    }
}

inline nlohmann::json optionalToJson(const std::optional<std::string> &value)
{
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json();
}

inline std::optional<std::string> optionalFromJson(const nlohmann::json &j,
                                                   const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

inline void to_json(nlohmann::json &j, const SourceLocation &location)
{
    j = nlohmann::json{
        {"file", location.file},
        {"lineStart", location.lineStart},
        {"lineEnd", location.lineEnd}
    };
}

inline void from_json(const nlohmann::json &j, SourceLocation &location)
{
    location.file = j.value("file", "");
    location.lineStart = j.value("lineStart", 0);
    location.lineEnd = j.value("lineEnd", 0);
}

inline void to_json(nlohmann::json &j, const FieldDefinition &field)
{
    j = nlohmann::json{{"name", field.name}, {"type", field.typeText}};
}

inline void from_json(const nlohmann::json &j, FieldDefinition &field)
{
    field.name = j.at("name").get<std::string>();
    field.typeText = j.value("type", "");
}

inline void to_json(nlohmann::json &j, const TypeDefinition &type)
{
    j = nlohmann::json{
        {"name", type.name},
        {"qualifiedName", type.qualifiedName},
        {"kind", type.kind},
        {"visibility", type.visibility},
        {"fields", type.fields},
        {"location", type.location}
    };
}

inline void from_json(const nlohmann::json &j, TypeDefinition &type)
{
    type.name = j.at("name").get<std::string>();
    type.qualifiedName = j.at("qualifiedName").get<std::string>();
    type.kind = j.contains("kind") ? j.at("kind").get<TypeKind>() : TypeKind::Struct;
    type.visibility = j.contains("visibility")
        ? j.at("visibility").get<Visibility>()
        : Visibility::Private;
    if (j.contains("fields") && j.at("fields").is_array()) {
        type.fields = j.at("fields").get<std::vector<FieldDefinition>>();
    } else {
        type.fields.clear();
    }
    if (j.contains("location")) {
        type.location = j.at("location").get<SourceLocation>();
    } else {
        type.location = SourceLocation{};
    }
}

inline void to_json(nlohmann::json &j, const CallSite &call)
{
    j = nlohmann::json{
        {"callee", call.callee},
        {"target", optionalToJson(call.target)},
        {"line", call.line}
    };
}

inline void from_json(const nlohmann::json &j, CallSite &call)
{
    call.callee = j.at("callee").get<std::string>();
    call.target = optionalFromJson(j, "target");
    call.line = j.value("line", 0);
}

inline void to_json(nlohmann::json &j, const Method &method)
{
    j = nlohmann::json{
        {"name", method.name},
        {"signature", method.signature},
        {"calls", method.calls}
    };
}

inline void from_json(const nlohmann::json &j, Method &method)
{
    method.name = j.at("name").get<std::string>();
    method.signature = j.value("signature", "");
    if (j.contains("calls") && j.at("calls").is_array()) {
        method.calls = j.at("calls").get<std::vector<CallSite>>();
    } else {
        method.calls.clear();
    }
}

inline void to_json(nlohmann::json &j, const ImplBlock &impl)
{
    j = nlohmann::json{
        {"target", impl.targetType},
        {"trait", optionalToJson(impl.traitName)},
        {"methods", impl.methods},
        {"location", impl.location}
    };
    if (!impl.scope.empty()) {
        j["scope"] = impl.scope;
    }
}

inline void from_json(const nlohmann::json &j, ImplBlock &impl)
{
    impl.targetType = j.at("target").get<std::string>();
    impl.traitName = optionalFromJson(j, "trait");
    if (j.contains("methods") && j.at("methods").is_array()) {
        impl.methods = j.at("methods").get<std::vector<Method>>();
    } else {
        impl.methods.clear();
    }
    if (j.contains("location")) {
        impl.location = j.at("location").get<SourceLocation>();
    } else {
        impl.location = SourceLocation{};
    }
    impl.scope = j.value("scope", "");
}

inline void to_json(nlohmann::json &j, const Import &import)
{
    j = nlohmann::json{{"path", import.path}, {"alias", optionalToJson(import.alias)}};
    if (!import.scope.empty()) {
        j["scope"] = import.scope;
    }
}

inline void from_json(const nlohmann::json &j, Import &import)
{
    import.path = j.at("path").get<std::string>();
    import.alias = optionalFromJson(j, "alias");
    import.scope = j.value("scope", "");
}

inline void to_json(nlohmann::json &j, const SourceUnit &unit)
{
    j = nlohmann::json{
        {"path", unit.path},
        {"module", unit.modulePath},
        {"types", unit.types},
        {"impls", unit.impls},
        {"imports", unit.imports}
    };
}

inline void from_json(const nlohmann::json &j, SourceUnit &unit)
{
    unit.path = j.at("path").get<std::string>();
    unit.modulePath = j.value("module", "crate");
    if (j.contains("types") && j.at("types").is_array()) {
        unit.types = j.at("types").get<std::vector<TypeDefinition>>();
    } else {
        unit.types.clear();
    }
    if (j.contains("impls") && j.at("impls").is_array()) {
        unit.impls = j.at("impls").get<std::vector<ImplBlock>>();
    } else {
        unit.impls.clear();
    }
    if (j.contains("imports") && j.at("imports").is_array()) {
        unit.imports = j.at("imports").get<std::vector<Import>>();
    } else {
        unit.imports.clear();
    }
}

inline void to_json(nlohmann::json &j, const ArchitectureDiff::ChangedField &field)
{
    j = nlohmann::json{{"path", field.path}, {"before", field.before}, {"after", field.after}};
}

inline void from_json(const nlohmann::json &j, ArchitectureDiff::ChangedField &field)
{
    field.path = j.value("path", "");
    field.before = j.contains("before") ? j.at("before") : nlohmann::json();
    field.after = j.contains("after") ? j.at("after") : nlohmann::json();
}

inline void to_json(nlohmann::json &j, const ArchitectureDiff::Modification &modification)
{
    j = nlohmann::json{
        {"before", modification.before},
        {"after", modification.after},
        {"changedFields", modification.changedFields}
    };
}

inline void to_json(nlohmann::json &j, const ArchitectureDiff &diff)
{
    j = nlohmann::json{
        {"snapshotAId", diff.snapshotAId},
        {"snapshotBId", diff.snapshotBId},
        {"granularity", diff.granularity == DiffGranularity::Method ? "method" : "type"},
        {"added", diff.added},
        {"removed", diff.removed},
        {"modified", diff.modified},
        {"unchanged", diff.unchanged}
    };
}

} // namespace archscope
