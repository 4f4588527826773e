#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/snapshot.hpp"

namespace archscope {

struct CallResolution {
    std::string targetType;
    std::string method;
    // Tuple struct or enum variant construction rather than a method call.
    bool construction = false;
};

/**
 * Resolves textual type paths and callees against a snapshot's registry.
 *
 * Lookups happen from a scope: the inline module path inside the unit's
 * file, empty for the file module itself. A single-segment name is looked
 * up among the scope module's own types, then through the use declarations
 * of that same module (explicit before glob). Paths that start with crate,
 * self or super are interpreted relative to the scope module. Names
 * excluded from the registry never resolve.
 */
class NameResolver {
public:
    explicit NameResolver(const ArchitectureSnapshot &snapshot);

    std::optional<std::string> resolveType(const SourceUnit &unit,
                                           const std::string &path,
                                           const std::string &scope = std::string()) const;
    std::optional<std::string> resolveImplTarget(const SourceUnit &unit,
                                                 const ImplBlock &impl) const;
    std::optional<std::string> resolveTrait(const SourceUnit &unit,
                                            const ImplBlock &impl) const;
    std::optional<CallResolution> resolveCall(const SourceUnit &unit,
                                              const std::string &callee,
                                              const std::optional<std::string> &enclosingType,
                                              const std::string &scope = std::string()) const;

    // Leading type path of a declared type, unwrapping references and
    // smart pointers: "&mut Box<Engine>" -> "Engine".
    static std::string primaryTypePath(const std::string &typeText);

private:
    bool isKnown(const std::string &qualifiedName) const;
    std::optional<std::string> resolveImportPath(const std::string &module,
                                                 const std::string &path) const;
    std::optional<std::string> resolveFieldType(const std::string &ownerType,
                                                const std::string &field) const;
    bool isVariant(const std::string &qualifiedName, const std::string &name) const;

    const ArchitectureSnapshot &m_snapshot;
};

// Module path of `scope` inside `unit`: ("crate::a", "inner") -> "crate::a::inner".
std::string scopeModule(const SourceUnit &unit, const std::string &scope);

// Inline module scope of a type declared in `unit`:
// ("crate::a", "crate::a::inner::Thing") -> "inner".
std::string scopeOfType(const SourceUnit &unit, const std::string &qualifiedName);

// "self::super::x" relative to "crate::a::b" -> "crate::a::x".
std::string normalizePath(const std::string &modulePath,
                          const std::vector<std::string> &segments);

// Fills every CallSite target from a fully built registry.
void resolveCallTargets(ArchitectureSnapshot &snapshot);

} // namespace archscope
