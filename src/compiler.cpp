#include "kiln/compiler.hpp"
#include "kiln/assembler.hpp"
#include "kiln/docs.hpp"

#include <atomic>
#include <cctype>

namespace kiln {

namespace {

std::atomic<uint64_t> next_session{1};

// Fill in file/line from the evaluation env where the error has none.
llvm::Error located(llvm::Error err, const Env& env) {
    if (!err) return err;
    Diagnostic d = to_diagnostic(std::move(err));
    if (d.file.empty()) d.file = env.file;
    if (d.line < 0) d.line = env.line;
    return make_error(std::move(d));
}

} // namespace

bool valid_module_name(const std::string& name) {
    if (name.empty()) return false;
    size_t start = 0;
    while (true) {
        size_t dot = name.find('.', start);
        std::string seg = name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (seg.empty() || !std::isupper(static_cast<unsigned char>(seg[0]))) return false;
        for (char c : seg)
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
        if (dot == std::string::npos) return true;
        start = dot + 1;
    }
}

Compiler::Compiler(Evaluator& evaluator, Dispatcher& dispatcher, Loader& loader, CompilerOptions options,
                   ModuleRegistry& registry, CodeServer& code_server)
    : evaluator_(evaluator), dispatcher_(dispatcher), loader_(loader), options_(std::move(options)),
      registry_(registry), code_server_(code_server), hooks_(evaluator, dispatcher),
      session_(next_session.fetch_add(1)) {}

Env Compiler::root_env(std::string file) const {
    Env e;
    e.file = std::move(file);
    e.line = 1;
    e.compiler = const_cast<Compiler*>(this);
    return e;
}

void Compiler::set_channel(std::shared_ptr<ModuleChannel> channel) {
    std::lock_guard<std::mutex> lock(mu_);
    channel_ = std::move(channel);
}

std::vector<std::pair<std::string, Artifact>> Compiler::binaries() const {
    std::lock_guard<std::mutex> lock(mu_);
    return binaries_;
}

void Compiler::warn(ModuleEntry& entry, Diagnostic d) {
    entry.add_warning(d);
    sink_.report(std::move(d));
}

std::optional<Diagnostic> Compiler::check_module_availability(const std::string& name, const Location& loc) const {
    if (options_.ignore_module_conflict) return std::nullopt;
    auto origin = code_server_.origin(name);
    if (!origin) return std::nullopt;
    Diagnostic d;
    d.code = codes::ModuleRedefinition;
    d.message = "redefining module " + name + " (current version " +
                (origin->empty() ? std::string("defined in memory") : "loaded from " + *origin) + ")";
    d.file = loc.file;
    d.line = loc.line;
    return d;
}

void Compiler::seed_attributes(ModuleEntry& entry) const {
    std::lock_guard<std::recursive_mutex> lock(entry.mutex());
    auto& attrs = entry.attributes();
    // Accumulating defaults start as empty lists rather than absent.
    for (const char* key : {"before-compile", "after-compile"})
        llvm::cantFail(attrs.declare_key(key, true, false));
    llvm::cantFail(attrs.write("moduledoc", n_nil()));
    llvm::cantFail(attrs.write("on-definition",
        node_vec({n_sym(HookEngine::BuiltinModule), n_sym(options_.docs ? "compile-doc" : "delete-doc")})));
}

llvm::Expected<CompiledModule> Compiler::compile_module(const std::string& name, const node_ptr& body,
                                                        const Bindings& bindings, const Env& env) {
    install_fatal_handler_if_requested();
    Location loc{env.file, env.line};
    if (!valid_module_name(name))
        return make_error(codes::InvalidModuleName, "invalid module name: " + name, loc.file, loc.line);
    if (ModuleRegistry::is_reserved(name))
        return make_error(codes::ModuleReserved, "module " + name + " is reserved and cannot be defined",
                          loc.file, loc.line);

    auto redefinition = check_module_availability(name, loc);
    auto handle = registry_.open(name, loc, session_);
    if (!handle) return handle.takeError();
    ModuleEntry& entry = handle->entry();
    if (redefinition) warn(entry, std::move(*redefinition));
    seed_attributes(entry);

    Env menv = env;
    menv.module = name;
    menv.function.clear();
    menv.compiling.push_back(name);
    menv.compiler = this;

    if (debug_enabled()) std::fprintf(stderr, "[dbg][compiler] compile %s (%s:%d)\n", name.c_str(), loc.file.c_str(), loc.line);
    auto result = run_pipeline(entry, body, bindings, menv);
    handle->close();
    if (!result) return normalize(name, result.takeError(), menv);

    if (auto err = loader_.load(name, result->artifact)) return located(std::move(err), menv);
    return result;
}

llvm::Expected<CompiledModule> Compiler::run_pipeline(ModuleEntry& entry, const node_ptr& body,
                                                      const Bindings& bindings, const Env& env) {
    auto evaluated = evaluator_.evaluate(body, bindings, env);
    if (!evaluated) return evaluated.takeError();

    entry.set_phase(Phase::BeforeHooks);
    auto before = hooks_.before_compile(entry, env);
    if (!before) return before.takeError();

    {
        std::lock_guard<std::recursive_mutex> lock(entry.mutex());
        entry.definitions().freeze();
    }
    entry.set_phase(Phase::Assembling);
    std::vector<Diagnostic> doc_warnings;
    auto sections = assemble_module(entry, options_, doc_warnings);
    for (auto& w : doc_warnings) warn(entry, std::move(w));
    if (!sections) return sections.takeError();

    entry.set_phase(Phase::Building);
    BuildOptions build_opts{sections->compile_opts, options_.target_triple};
    const std::string& name = entry.name();
    auto artifact = builder_.build(*sections, build_opts, [&](const Artifact& a) -> llvm::Error {
        entry.set_phase(Phase::AfterHooks);
        if (auto err = hooks_.after_compile(entry, env, a)) return err;
        std::shared_ptr<ModuleChannel> channel;
        {
            std::lock_guard<std::mutex> lock(mu_);
            binaries_.emplace_back(name, a);
            channel = channel_;
        }
        if (channel) channel->publish(ModuleAvailable{env.file, name, a});
        return llvm::Error::success();
    });
    if (!artifact) return artifact.takeError();

    CompiledModule out;
    out.name = name;
    out.value = evaluated->value;
    out.artifact = std::move(*artifact);
    out.warnings = entry.warnings();
    return out;
}

llvm::Error Compiler::normalize(const std::string& name, llvm::Error err, const Env& env) const {
    Diagnostic d = to_diagnostic(std::move(err));
    if (d.code == codes::UndefinedFunction && !d.stack.empty() && d.stack.front().module == name) {
        const Frame top = d.stack.front();
        d.code = codes::FunctionNotAvailable;
        d.message = "function " + name + "." + top.function + "/" + std::to_string(top.arity) +
                    " is undefined (function not available)";
        d.hint = "module " + name + " is still being compiled, its functions cannot be called yet";
        d.origin = top;
    }
    if (d.file.empty()) d.file = env.file;
    if (d.line < 0) d.line = env.line;
    return make_error(std::move(d));
}

llvm::Expected<std::shared_ptr<ModuleEntry>> Compiler::require_entry(const Env& env, const char* operation) const {
    if (env.module.empty())
        return make_error(codes::InvalidPhase, std::string(operation) + " called outside of a module body",
                          env.file, env.line);
    auto entry = registry_.lookup(env.module);
    if (!entry)
        return make_error(codes::InvalidPhase,
            std::string(operation) + " called for module " + env.module + " which is not being compiled",
            env.file, env.line);
    return entry;
}

llvm::Error Compiler::define(const Env& env, DefKind kind, const NameArity& id, node_ptr clause) {
    auto entry = require_entry(env, def_kind_name(kind));
    if (!entry) return entry.takeError();
    bool is_new = false;
    {
        std::lock_guard<std::recursive_mutex> lock((*entry)->mutex());
        Phase p = (*entry)->phase();
        if (p != Phase::Evaluating && p != Phase::BeforeHooks)
            return make_error(codes::InvalidPhase,
                "cannot define " + id.str() + " in module " + env.module + " during " + phase_name(p),
                env.file, env.line);
        if (auto err = (*entry)->definitions().define(kind, id, clause, env.line, &is_new))
            return located(std::move(err), env);
    }
    if (!is_new) return llvm::Error::success();
    return located(hooks_.on_definition(**entry, env, kind, id, clause), env);
}

llvm::Error Compiler::put_attribute(const Env& env, const std::string& key, node_ptr value) {
    auto entry = require_entry(env, "put_attribute");
    if (!entry) return entry.takeError();
    std::lock_guard<std::recursive_mutex> lock((*entry)->mutex());
    if (auto err = (*entry)->ensure_open("put_attribute")) return located(std::move(err), env);
    node_ptr stored = is_doc_key(key) ? doc_entry(env.line, value) : value;
    if (auto err = (*entry)->attributes().write(key, stored)) return located(std::move(err), env);
    return located(consume_pending_docs(**entry, key, value, env.line), env);
}

std::optional<node_ptr> Compiler::get_attribute(const Env& env, const std::string& key) const {
    if (env.module.empty()) return std::nullopt;
    return registry_.get_attribute(env.module, key);
}

llvm::Error Compiler::register_attribute(const Env& env, const std::string& key, bool accumulate, bool persist) {
    auto entry = require_entry(env, "register_attribute");
    if (!entry) return entry.takeError();
    std::lock_guard<std::recursive_mutex> lock((*entry)->mutex());
    if (auto err = (*entry)->ensure_open("register_attribute")) return located(std::move(err), env);
    return located((*entry)->attributes().declare_key(key, accumulate, persist), env);
}

llvm::Error Compiler::delete_attribute(const Env& env, const std::string& key) {
    auto entry = require_entry(env, "delete_attribute");
    if (!entry) return entry.takeError();
    std::lock_guard<std::recursive_mutex> lock((*entry)->mutex());
    if (auto err = (*entry)->ensure_open("delete_attribute")) return located(std::move(err), env);
    (*entry)->attributes().erase(key);
    return llvm::Error::success();
}

} // namespace kiln
