#include "query/query_compilation.h"

namespace quarry {
namespace query {

std::optional<Value> QueryParameters::lookup(const Parameter& p) const {
    if (p.position) {
        auto it = positional.find(*p.position);
        if (it != positional.end()) return it->second;
    }
    if (p.name.empty()) return std::nullopt;
    return lookup(p.name);
}

std::optional<Value> QueryParameters::lookup(const std::string& name) const {
    auto it = named.find(name);
    if (it == named.end()) return std::nullopt;
    return it->second;
}

} // namespace query
} // namespace quarry
