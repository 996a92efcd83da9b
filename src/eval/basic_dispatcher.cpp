#include "kiln/eval/basic_dispatcher.hpp"
#include "kiln/diagnostics.hpp"
#include "kiln/options.hpp"

namespace kiln::eval {

llvm::Expected<Dispatch> BasicDispatcher::dispatch(const Call& call, const Env& env) {
    const std::string key = call.module + "." + call.function;
    if (auto it = expanders_.find(key); it != expanders_.end()) {
        if (auto expanded = it->second(call, env)) {
            if (debug_enabled()) std::fprintf(stderr, "[dbg][dispatch] expand %s/%d\n", key.c_str(), call.arity());
            return Dispatch::expansion(*expanded);
        }
    }
    if (auto it = functions_.find(key); it != functions_.end()) {
        if (debug_enabled()) std::fprintf(stderr, "[dbg][dispatch] apply %s/%d\n", key.c_str(), call.arity());
        auto r = it->second(call, env);
        if (!r) return r.takeError();
        return Dispatch::applied_env(std::move(*r));
    }
    const NameArity id{call.function, call.arity()};
    // Exported by a loaded module: resolved, but not run.
    if (code_server_.exports_function(call.module, id)) return Dispatch::applied_env(env);

    Diagnostic d;
    d.code = codes::UndefinedFunction;
    d.message = code_server_.is_loaded(call.module)
        ? "function " + call.module + "." + id.str() + " is undefined or private"
        : "function " + call.module + "." + id.str() + " is undefined (module " + call.module + " is not available)";
    d.file = env.file;
    d.line = env.line;
    d.stack.push_back(Frame{call.module, call.function, id.arity, env.file, env.line});
    return make_error(std::move(d));
}

} // namespace kiln::eval
