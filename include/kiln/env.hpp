// Evaluation context threaded through body evaluation, hooks and nested compiles.
#pragma once
#include "kiln/form.hpp"

#include <string>
#include <utility>
#include <vector>

namespace kiln {

class Compiler;

struct Location {
    std::string file;
    int line = -1;
};

using Bindings = std::vector<std::pair<std::string, node_ptr>>;

// Latest binding wins; nullptr when unbound.
node_ptr lookup(const Bindings& b, const std::string& name);
void bind(Bindings& b, std::string name, node_ptr value);

struct Env {
    std::string file;
    int line = -1;
    std::string module;                 // module whose body is being evaluated, empty at top level
    std::string function;               // enclosing function, empty at module level
    std::vector<std::string> compiling; // modules currently being compiled, innermost last
    Compiler* compiler = nullptr;       // session the evaluation belongs to (not owned)

    Location location() const { return Location{file, line}; }
    Env at(int l) const { Env e = *this; if (l >= 0) e.line = l; return e; }
};

} // namespace kiln
