// Compile-time hook engine: on-definition, before-compile and after-compile.
//
// Hooks registered through the accumulating attributes of the same name run
// newest registration first. A target is either a module symbol (the default
// function name is used) or a [Module function] vector.
#pragma once
#include "kiln/collaborators.hpp"
#include "kiln/definitions.hpp"
#include "kiln/registry.hpp"

#include <functional>
#include <string>
#include <unordered_map>

#include <llvm/Support/Error.h>

namespace kiln {

struct HookTarget {
    std::string module;
    std::string function;
};

llvm::Expected<HookTarget> parse_hook_target(const std::string& key, const node_ptr& value, const char* default_function);

class HookEngine {
public:
    using Builtin = std::function<llvm::Error(ModuleEntry&, const Call&, const Env&)>;

    static constexpr const char* BuiltinModule = "Kiln.Module";

    HookEngine(Evaluator& evaluator, Dispatcher& dispatcher);

    HookEngine& add_builtin(const std::string& module, const std::string& function, Builtin fn);

    // Fired once for each newly defined (name, arity). Definitions added by the
    // hooks themselves do not fire again.
    llvm::Error on_definition(ModuleEntry& entry, const Env& env, DefKind kind, const NameArity& id, const node_ptr& clause);

    // Threads the environment through every before-compile hook.
    llvm::Expected<Env> before_compile(ModuleEntry& entry, const Env& env);

    llvm::Error after_compile(ModuleEntry& entry, const Env& env, const Artifact& artifact);

    // Dispatch one call: an applied call yields its environment, an expansion
    // is evaluated in `env`. Errors gain a frame for the hook and lose the
    // evaluator's own frames.
    llvm::Expected<Env> expand_callback(const Call& call, const Env& env);

private:
    llvm::Expected<std::vector<HookTarget>> targets(ModuleEntry& entry, const std::string& key,
                                                    const char* default_function) const;
    llvm::Error annotate(llvm::Error err, const Call& call, const Env& env) const;

    Evaluator& evaluator_;
    Dispatcher& dispatcher_;
    std::unordered_map<std::string, Builtin> builtins_;
};

} // namespace kiln
