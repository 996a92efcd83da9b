// Compiler session: drives one module body through
// evaluate -> before-compile -> assemble -> build -> after-compile -> load,
// and exposes the module-building operations body evaluation calls into.
#pragma once
#include "kiln/artifact.hpp"
#include "kiln/artifact_builder.hpp"
#include "kiln/code_server.hpp"
#include "kiln/collaborators.hpp"
#include "kiln/diagnostics.hpp"
#include "kiln/hooks.hpp"
#include "kiln/options.hpp"
#include "kiln/registry.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

struct CompiledModule {
    std::string name;
    node_ptr value;   // result of evaluating the body
    Artifact artifact;
    std::vector<Diagnostic> warnings;
};

class Compiler {
public:
    Compiler(Evaluator& evaluator, Dispatcher& dispatcher, Loader& loader,
             CompilerOptions options = detect_options(),
             ModuleRegistry& registry = ModuleRegistry::global(),
             CodeServer& code_server = CodeServer::global());

    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    // Compile `body` as module `name`. On any failure the registry entry is
    // released and the error is returned with file and line filled in.
    llvm::Expected<CompiledModule> compile_module(const std::string& name, const node_ptr& body,
                                                  const Bindings& bindings, const Env& env);

    // ---- operations available while a body is being evaluated (env.module) ----
    llvm::Error define(const Env& env, DefKind kind, const NameArity& id, node_ptr clause);
    llvm::Error put_attribute(const Env& env, const std::string& key, node_ptr value);
    std::optional<node_ptr> get_attribute(const Env& env, const std::string& key) const;
    llvm::Error register_attribute(const Env& env, const std::string& key, bool accumulate, bool persist);
    llvm::Error delete_attribute(const Env& env, const std::string& key);

    // Modules being compiled in the evaluation `env` belongs to, innermost last.
    static std::vector<std::string> compiler_modules(const Env& env) { return env.compiling; }

    // Top-level environment for evaluating a file in this session.
    Env root_env(std::string file) const;

    // Subscribe a listening session to "module available" notifications.
    void set_channel(std::shared_ptr<ModuleChannel> channel);
    // Every artifact built by this session, in build order.
    std::vector<std::pair<std::string, Artifact>> binaries() const;

    const CompilerOptions& options() const { return options_; }
    ModuleRegistry& registry() { return registry_; }
    CodeServer& code_server() { return code_server_; }
    DiagnosticSink& sink() { return sink_; }
    HookEngine& hooks() { return hooks_; }
    uint64_t session_id() const { return session_; }

private:
    llvm::Expected<std::shared_ptr<ModuleEntry>> require_entry(const Env& env, const char* operation) const;
    std::optional<Diagnostic> check_module_availability(const std::string& name, const Location& loc) const;
    void seed_attributes(ModuleEntry& entry) const;
    llvm::Expected<CompiledModule> run_pipeline(ModuleEntry& entry, const node_ptr& body,
                                                const Bindings& bindings, const Env& env);
    llvm::Error normalize(const std::string& name, llvm::Error err, const Env& env) const;
    void warn(ModuleEntry& entry, Diagnostic d);

    Evaluator& evaluator_;
    Dispatcher& dispatcher_;
    Loader& loader_;
    CompilerOptions options_;
    ModuleRegistry& registry_;
    CodeServer& code_server_;
    DiagnosticSink sink_;
    HookEngine hooks_;
    ArtifactBuilder builder_;
    uint64_t session_;

    mutable std::mutex mu_;
    std::shared_ptr<ModuleChannel> channel_;
    std::vector<std::pair<std::string, Artifact>> binaries_;
};

// Module names are dot-separated segments, each starting with an uppercase letter.
bool valid_module_name(const std::string& name);

} // namespace kiln
