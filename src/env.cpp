#include "kiln/env.hpp"

namespace kiln {

node_ptr lookup(const Bindings& b, const std::string& name) {
    for (auto it = b.rbegin(); it != b.rend(); ++it)
        if (it->first == name) return it->second;
    return nullptr;
}

void bind(Bindings& b, std::string name, node_ptr value) {
    b.emplace_back(std::move(name), std::move(value));
}

} // namespace kiln
