#include "extract/name_resolver.hpp"

#include <array>
#include <cctype>
#include <string_view>

namespace archscope {

namespace {

bool isPathAnchor(const std::string &segment)
{
    return segment == "crate" || segment == "self" || segment == "super";
}

bool isGlob(const Import &import)
{
    const std::string suffix = "::*";
    return import.path.size() > suffix.size()
        && import.path.compare(import.path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Name an import binds in the importing module, if any.
std::optional<std::string> boundName(const Import &import)
{
    if (import.alias.has_value()) {
        if (*import.alias == "_") {
            return std::nullopt;
        }
        return import.alias;
    }
    const auto segments = splitPath(import.path);
    if (segments.empty()) {
        return std::nullopt;
    }
    return segments.back();
}

bool isTransparentWrapper(std::string_view name)
{
    static const std::array<std::string_view, 14> wrappers = {
        "mut", "dyn", "impl", "const", "Box", "Arc", "Rc", "RefCell",
        "Cell", "Mutex", "RwLock", "Option", "Cow", "Pin",
    };
    for (const auto &wrapper : wrappers) {
        if (name == wrapper) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string normalizePath(const std::string &modulePath,
                          const std::vector<std::string> &segments)
{
    std::vector<std::string> base = splitPath(modulePath);
    size_t i = 0;
    if (!segments.empty() && segments.front() == "crate") {
        base = {"crate"};
        i = 1;
    }
    for (; i < segments.size(); ++i) {
        if (segments[i] == "self") {
            continue;
        }
        if (segments[i] == "super") {
            if (base.size() > 1) {
                base.pop_back();
            }
            continue;
        }
        break;
    }
    for (; i < segments.size(); ++i) {
        base.push_back(segments[i]);
    }
    return joinPath(base);
}

NameResolver::NameResolver(const ArchitectureSnapshot &snapshot)
    : m_snapshot(snapshot)
{
}

bool NameResolver::isKnown(const std::string &qualifiedName) const
{
    return m_snapshot.registry.contains(qualifiedName);
}

std::string scopeModule(const SourceUnit &unit, const std::string &scope)
{
    return scope.empty() ? unit.modulePath : unit.modulePath + "::" + scope;
}

std::string scopeOfType(const SourceUnit &unit, const std::string &qualifiedName)
{
    const std::string prefix = unit.modulePath + "::";
    if (qualifiedName.rfind(prefix, 0) != 0) {
        return {};
    }
    const std::string inner = qualifiedName.substr(prefix.size());
    const size_t last = inner.rfind("::");
    return last == std::string::npos ? std::string() : inner.substr(0, last);
}

std::optional<std::string> NameResolver::resolveImportPath(const std::string &module,
                                                           const std::string &path) const
{
    const auto segments = splitPath(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    if (isPathAnchor(segments.front())) {
        const std::string absolute = normalizePath(module, segments);
        if (isKnown(absolute)) {
            return absolute;
        }
        return std::nullopt;
    }

    const std::array<std::string, 3> candidates = {
        path,
        module + "::" + path,
        "crate::" + path,
    };
    for (const auto &candidate : candidates) {
        if (isKnown(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> NameResolver::resolveType(const SourceUnit &unit,
                                                     const std::string &path,
                                                     const std::string &scope) const
{
    const auto segments = splitPath(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    const std::string module = scopeModule(unit, scope);
    const std::string &head = segments.front();
    if (isPathAnchor(head)) {
        return resolveImportPath(module, path);
    }

    if (segments.size() == 1) {
        const std::string local = module + "::" + head;
        if (isKnown(local)) {
            return local;
        }
        for (const auto &import : unit.imports) {
            if (import.scope != scope || isGlob(import)) {
                continue;
            }
            const auto bound = boundName(import);
            if (bound.has_value() && *bound == head) {
                if (auto resolved = resolveImportPath(module, import.path)) {
                    return resolved;
                }
            }
        }
        for (const auto &import : unit.imports) {
            if (import.scope != scope || !isGlob(import)) {
                continue;
            }
            const std::string base = import.path.substr(0, import.path.size() - 3);
            if (auto resolved = resolveImportPath(module, base + "::" + head)) {
                return resolved;
            }
        }
        return std::nullopt;
    }

    // Multi-segment: the head may be an imported module or type.
    const std::string rest = joinPath(std::vector<std::string>(segments.begin() + 1,
                                                               segments.end()));
    for (const auto &import : unit.imports) {
        if (import.scope != scope || isGlob(import)) {
            continue;
        }
        const auto bound = boundName(import);
        if (bound.has_value() && *bound == head) {
            if (auto resolved = resolveImportPath(module, import.path + "::" + rest)) {
                return resolved;
            }
        }
    }
    return resolveImportPath(module, path);
}

std::optional<std::string> NameResolver::resolveImplTarget(const SourceUnit &unit,
                                                           const ImplBlock &impl) const
{
    return resolveType(unit, impl.targetType, impl.scope);
}

std::optional<std::string> NameResolver::resolveTrait(const SourceUnit &unit,
                                                      const ImplBlock &impl) const
{
    if (!impl.traitName.has_value()) {
        return std::nullopt;
    }
    return resolveType(unit, *impl.traitName, impl.scope);
}

std::string NameResolver::primaryTypePath(const std::string &typeText)
{
    size_t i = 0;
    while (i < typeText.size()) {
        const unsigned char c = static_cast<unsigned char>(typeText[i]);
        if (c == '\'') {
            // Lifetime
            ++i;
            while (i < typeText.size()
                   && (std::isalnum(static_cast<unsigned char>(typeText[i])) || typeText[i] == '_')) {
                ++i;
            }
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
        const auto segments = splitPath(path);
        if (!segments.empty() && !isTransparentWrapper(segments.back())) {
            return path;
        }
    }
    return {};
}

std::optional<std::string> NameResolver::resolveFieldType(const std::string &ownerType,
                                                          const std::string &field) const
{
    const TypeDefinition *owner = m_snapshot.findType(ownerType);
    if (!owner) {
        return std::nullopt;
    }
    const SourceUnit *ownerUnit = m_snapshot.findUnit(m_snapshot.registry.at(ownerType));
    for (const auto &candidate : owner->fields) {
        if (candidate.name == field) {
            const std::string path = primaryTypePath(candidate.typeText);
            if (path.empty() || !ownerUnit) {
                return std::nullopt;
            }
            return resolveType(*ownerUnit, path, scopeOfType(*ownerUnit, ownerType));
        }
    }
    return std::nullopt;
}

bool NameResolver::isVariant(const std::string &qualifiedName, const std::string &name) const
{
    const TypeDefinition *type = m_snapshot.findType(qualifiedName);
    if (!type || type->kind != TypeKind::Enum) {
        return false;
    }
    for (const auto &variant : type->fields) {
        if (variant.name == name) {
            return true;
        }
    }
    return false;
}

std::optional<CallResolution> NameResolver::resolveCall(
    const SourceUnit &unit,
    const std::string &callee,
    const std::optional<std::string> &enclosingType,
    const std::string &scope) const
{
    const size_t dot = callee.rfind('.');
    if (dot != std::string::npos) {
        if (!enclosingType.has_value()) {
            return std::nullopt;
        }
        const std::string method = callee.substr(dot + 1);
        const std::string receiver = callee.substr(0, dot);
        if (receiver == "self") {
            return CallResolution{*enclosingType, method, false};
        }
        const std::string selfPrefix = "self.";
        if (receiver.rfind(selfPrefix, 0) == 0) {
            if (auto fieldType = resolveFieldType(*enclosingType,
                                                  receiver.substr(selfPrefix.size()))) {
                return CallResolution{*fieldType, method, false};
            }
        }
        return std::nullopt;
    }

    const auto segments = splitPath(callee);
    if (segments.empty()) {
        return std::nullopt;
    }
    if (segments.size() == 1) {
        if (segments.front() == "Self") {
            if (!enclosingType.has_value()) {
                return std::nullopt;
            }
            return CallResolution{*enclosingType, "Self", true};
        }
        // Tuple struct construction: Point(1, 2)
        if (auto type = resolveType(unit, segments.front(), scope)) {
            return CallResolution{*type, segments.front(), true};
        }
        return std::nullopt;
    }

    const std::string method = segments.back();
    const std::vector<std::string> typeSegments(segments.begin(), segments.end() - 1);
    if (typeSegments.size() == 1 && typeSegments.front() == "Self") {
        if (!enclosingType.has_value()) {
            return std::nullopt;
        }
        return CallResolution{*enclosingType, method, isVariant(*enclosingType, method)};
    }
    if (auto type = resolveType(unit, joinPath(typeSegments), scope)) {
        return CallResolution{*type, method, isVariant(*type, method)};
    }
    if (auto type = resolveType(unit, callee, scope)) {
        return CallResolution{*type, method, true};
    }
    return std::nullopt;
}

void resolveCallTargets(ArchitectureSnapshot &snapshot)
{
    const NameResolver resolver(snapshot);
    for (auto &[path, unit] : snapshot.units) {
        for (auto &impl : unit.impls) {
            const auto enclosing = resolver.resolveImplTarget(unit, impl);
            for (auto &method : impl.methods) {
                for (auto &call : method.calls) {
                    const auto resolution = resolver.resolveCall(unit, call.callee, enclosing,
                                                                 impl.scope);
                    if (resolution.has_value()) {
                        call.target = resolution->targetType;
                    } else {
                        call.target.reset();
                    }
                }
            }
        }
    }
}

} // namespace archscope
