#pragma once
// Shared fixture for the compiler tests: one isolated registry, code server
// and compiler session per test so module names never collide.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kiln/compiler.hpp"
#include "kiln/eval/basic_dispatcher.hpp"
#include "kiln/eval/basic_evaluator.hpp"
#include "kiln/eval/memory_loader.hpp"
#include "kiln/reader.hpp"

namespace kiln::test {

inline CompilerOptions quiet_options(){
    CompilerOptions o;
    o.docs = true;
    return o;
}

struct Session {
    ModuleRegistry registry;
    CodeServer code_server;
    eval::BasicDispatcher dispatcher{code_server};
    eval::BasicEvaluator evaluator{dispatcher};
    eval::MemoryLoader loader{code_server};
    Compiler compiler;
    std::vector<Diagnostic> warnings;

    explicit Session(CompilerOptions opts = quiet_options())
        : compiler(evaluator, dispatcher, loader, opts, registry, code_server) {
        compiler.sink().on_report([this](const Diagnostic& d){ warnings.push_back(d); });
    }

    // Evaluate every top-level form of `src`; value of the last one.
    llvm::Expected<node_ptr> run(const std::string& src, const std::string& file = "test.kiln"){
        Bindings b;
        Env env = compiler.root_env(file);
        node_ptr last = n_nil();
        for(auto& form : read_all(src, file)){
            auto r = evaluator.evaluate(form, b, env);
            if(!r) return r.takeError();
            b = std::move(r->bindings);
            last = r->value;
        }
        return last;
    }

    Artifact artifact(const std::string& module) const {
        auto loaded = code_server.find(module);
        return loaded ? loaded->artifact : Artifact{};
    }

    std::string chunk(const std::string& module, const char* id) const {
        auto payload = artifact(module).find(id);
        return payload ? *payload : std::string();
    }

    std::string info(const std::string& module, InfoKind kind) const {
        auto r = artifact(module).info(kind);
        if(!r) return "<error: " + to_diagnostic(r.takeError()).message + ">";
        return *r;
    }
};

// Success value, or a recorded failure (and nullptr) when the run errored.
inline node_ptr ok(llvm::Expected<node_ptr> r){
    if(!r){
        ADD_FAILURE() << "unexpected error: " << format(to_diagnostic(r.takeError()));
        return nullptr;
    }
    return *r;
}

// The diagnostic of a failed run; records a failure when the run succeeded.
inline Diagnostic error_of(llvm::Expected<node_ptr> r){
    if(r){
        ADD_FAILURE() << "expected an error, got " << to_string(*r);
        return {};
    }
    return to_diagnostic(r.takeError());
}

inline bool contains(const std::string& haystack, const std::string& needle){
    return haystack.find(needle) != std::string::npos;
}

} // namespace kiln::test
