// Interfaces the compiler drives but does not implement: body evaluation,
// hook dispatch and loading. Reference implementations live in kiln/eval/.
#pragma once
#include "kiln/artifact.hpp"
#include "kiln/env.hpp"
#include "kiln/form.hpp"

#include <optional>
#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

struct EvalResult {
    node_ptr value;
    Bindings bindings;
    Env env;
};

class Evaluator {
public:
    virtual ~Evaluator() = default;
    virtual llvm::Expected<EvalResult> evaluate(const node_ptr& form, const Bindings& bindings, const Env& env) = 0;
};

// A call to (module, function) made by a hook. The environment is always an
// implicit first argument; after-compile hooks also receive the artifact.
struct Call {
    std::string module;
    std::string function;
    std::vector<node_ptr> args;
    const Artifact* artifact = nullptr;
    int arity() const { return 1 + static_cast<int>(args.size()) + (artifact ? 1 : 0); }
};

// Outcome of dispatching a call: either the call ran and produced an
// environment, or it expanded to a form that must be evaluated in the caller.
struct Dispatch {
    std::optional<Env> applied;
    node_ptr expanded;

    static Dispatch applied_env(Env e) { Dispatch d; d.applied = std::move(e); return d; }
    static Dispatch expansion(node_ptr f) { Dispatch d; d.expanded = std::move(f); return d; }
};

class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    virtual llvm::Expected<Dispatch> dispatch(const Call& call, const Env& env) = 0;
};

class Loader {
public:
    virtual ~Loader() = default;
    virtual llvm::Error load(const std::string& module, const Artifact& artifact) = 0;
};

} // namespace kiln
