#include "kiln/hooks.hpp"
#include "kiln/diagnostics.hpp"
#include "kiln/docs.hpp"
#include "kiln/options.hpp"

namespace kiln {

llvm::Expected<HookTarget> parse_hook_target(const std::string& key, const node_ptr& value, const char* default_function) {
    if (value && is_symbol(*value)) return HookTarget{name_of(value), default_function};
    if (value && (is_vector(*value) || is_list(*value))) {
        auto& el = elements(*value);
        if (el.size() == 2 && is_symbol(*el[0]) && (is_symbol(*el[1]) || is_keyword(*el[1])))
            return HookTarget{name_of(el[0]), name_of(el[1])};
    }
    return make_error(codes::InvalidAttribute,
        "invalid @" + key + " " + to_string(value) + ", expected a module or [Module function]", {}, line(value));
}

HookEngine::HookEngine(Evaluator& evaluator, Dispatcher& dispatcher)
    : evaluator_(evaluator), dispatcher_(dispatcher) {
    add_builtin(BuiltinModule, "compile-doc", compile_doc_hook);
    add_builtin(BuiltinModule, "delete-doc", delete_doc_hook);
}

HookEngine& HookEngine::add_builtin(const std::string& module, const std::string& function, Builtin fn) {
    builtins_[module + "." + function] = std::move(fn);
    return *this;
}

llvm::Expected<std::vector<HookTarget>> HookEngine::targets(ModuleEntry& entry, const std::string& key,
                                                            const char* default_function) const {
    std::optional<node_ptr> registered;
    {
        std::lock_guard<std::recursive_mutex> lock(entry.mutex());
        registered = entry.attributes().read(key);
    }
    std::vector<HookTarget> out;
    if (!registered) return out;
    // read() lists accumulated values newest first
    for (auto& v : elements(**registered)) {
        auto t = parse_hook_target(key, v, default_function);
        if (!t) return t.takeError();
        out.push_back(std::move(*t));
    }
    return out;
}

llvm::Error HookEngine::on_definition(ModuleEntry& entry, const Env& env, DefKind kind, const NameArity& id,
                                      const node_ptr& clause) {
    if (entry.in_definition_hook.exchange(true)) return llvm::Error::success();
    struct Reset {
        ModuleEntry& e;
        ~Reset() { e.in_definition_hook = false; }
    } reset{entry};

    auto hooks = targets(entry, "on-definition", "__on_definition__");
    if (!hooks) return hooks.takeError();
    for (auto& t : *hooks) {
        Call call{t.module, t.function,
                  {n_kw(def_kind_name(kind)), n_sym(id.name), n_i64(id.arity), clause}, nullptr};
        if (debug_enabled()) std::fprintf(stderr, "[dbg][hooks] on-definition %s.%s for %s\n", t.module.c_str(), t.function.c_str(), id.str().c_str());
        auto b = builtins_.find(t.module + "." + t.function);
        if (b != builtins_.end()) {
            if (auto err = b->second(entry, call, env)) return annotate(std::move(err), call, env);
            continue;
        }
        auto r = expand_callback(call, env);
        if (!r) return r.takeError();
    }
    return llvm::Error::success();
}

llvm::Expected<Env> HookEngine::before_compile(ModuleEntry& entry, const Env& env) {
    auto hooks = targets(entry, "before-compile", "__before_compile__");
    if (!hooks) return hooks.takeError();
    Env acc = env;
    for (auto& t : *hooks) {
        if (debug_enabled()) std::fprintf(stderr, "[dbg][hooks] before-compile %s.%s\n", t.module.c_str(), t.function.c_str());
        auto r = expand_callback(Call{t.module, t.function, {}, nullptr}, acc);
        if (!r) return r.takeError();
        acc = std::move(*r);
    }
    return acc;
}

llvm::Error HookEngine::after_compile(ModuleEntry& entry, const Env& env, const Artifact& artifact) {
    auto hooks = targets(entry, "after-compile", "__after_compile__");
    if (!hooks) return hooks.takeError();
    for (auto& t : *hooks) {
        if (debug_enabled()) std::fprintf(stderr, "[dbg][hooks] after-compile %s.%s\n", t.module.c_str(), t.function.c_str());
        auto r = expand_callback(Call{t.module, t.function, {}, &artifact}, env);
        if (!r) return r.takeError();
    }
    return llvm::Error::success();
}

llvm::Expected<Env> HookEngine::expand_callback(const Call& call, const Env& env) {
    auto d = dispatcher_.dispatch(call, env);
    if (!d) return annotate(d.takeError(), call, env);
    if (d->applied) return std::move(*d->applied);
    if (!d->expanded) return env;
    auto r = evaluator_.evaluate(d->expanded, Bindings{}, env);
    if (!r) return annotate(r.takeError(), call, env);
    return std::move(r->env);
}

llvm::Error HookEngine::annotate(llvm::Error err, const Call& call, const Env& env) const {
    Diagnostic d = to_diagnostic(std::move(err));
    std::vector<Frame> kept;
    for (auto& f : d.stack) {
        if (is_internal(f)) break;
        kept.push_back(f);
    }
    kept.push_back(Frame{call.module, call.function, call.arity(), env.file, env.line});
    d.stack = std::move(kept);
    if (d.file.empty()) {
        d.file = env.file;
        if (d.line < 0) d.line = env.line;
    }
    return make_error(std::move(d));
}

} // namespace kiln
