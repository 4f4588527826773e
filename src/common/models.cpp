#include "common/models.hpp"

#include <algorithm>
#include <tuple>

namespace archscope {

void canonicalize(SourceUnit &unit)
{
    std::stable_sort(unit.types.begin(), unit.types.end(),
                     [](const TypeDefinition &a, const TypeDefinition &b) {
                         return std::tie(a.name, a.qualifiedName)
                             < std::tie(b.name, b.qualifiedName);
                     });

    for (auto &impl : unit.impls) {
        for (auto &method : impl.methods) {
            std::stable_sort(method.calls.begin(), method.calls.end(),
                             [](const CallSite &a, const CallSite &b) {
                                 return std::tie(a.line, a.callee)
                                     < std::tie(b.line, b.callee);
                             });
        }
        std::stable_sort(impl.methods.begin(), impl.methods.end(),
                         [](const Method &a, const Method &b) {
                             return std::tie(a.name, a.signature)
                                 < std::tie(b.name, b.signature);
                         });
    }

    // An absent trait sorts before any named trait.
    std::stable_sort(unit.impls.begin(), unit.impls.end(),
                     [](const ImplBlock &a, const ImplBlock &b) {
                         return std::tie(a.scope, a.targetType, a.traitName)
                             < std::tie(b.scope, b.targetType, b.traitName);
                     });

    std::sort(unit.imports.begin(), unit.imports.end(),
              [](const Import &a, const Import &b) {
                  return std::tie(a.scope, a.path, a.alias)
                      < std::tie(b.scope, b.path, b.alias);
              });
    unit.imports.erase(std::unique(unit.imports.begin(), unit.imports.end()),
                       unit.imports.end());
}

std::vector<std::string> splitPath(const std::string &path)
{
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        const size_t pos = path.find("::", start);
        const std::string segment = path.substr(
            start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!segment.empty()) {
            segments.push_back(segment);
        }
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 2;
    }
    return segments;
}

std::string joinPath(const std::vector<std::string> &segments)
{
    std::string result;
    for (const auto &segment : segments) {
        if (!result.empty()) {
            result += "::";
        }
        result += segment;
    }
    return result;
}

} // namespace archscope
