// Hooks example: a before-compile hook injects a function and an
// after-compile hook reports the artifact, then __info__ is read back.
#include <iostream>
#include <string>
#include "kiln/compiler.hpp"
#include "kiln/eval/basic_dispatcher.hpp"
#include "kiln/eval/basic_evaluator.hpp"
#include "kiln/eval/memory_loader.hpp"
#include "kiln/reader.hpp"

using namespace kiln;

int main(){
    const char* src = R"KILN(
        (defmodule Greeter
          (@ :moduledoc "Says hello.")
          (@ :before-compile Stamp)
          (@ :after-compile Report)
          (@ :doc "Greets someone by name.")
          (@ :spec (hello [string] string))
          (def hello [name] (quote (concat "hello " name))))
    )KILN";

    eval::BasicDispatcher dispatcher;
    dispatcher.add_expander("Stamp", "__before_compile__", [](const Call&, const Env&) -> std::optional<node_ptr> {
        return kiln::read("(def stamp [] \"built by hooks_example\")");
    });
    dispatcher.add_function("Report", "__after_compile__", [](const Call& call, const Env& env) -> llvm::Expected<Env> {
        std::cout << env.module << ": " << (call.artifact ? call.artifact->size() : 0) << " bytes\n";
        return env;
    });
    eval::BasicEvaluator evaluator(dispatcher);
    eval::MemoryLoader loader;
    Compiler compiler(evaluator, dispatcher, loader);

    Bindings bindings;
    for(auto& form : read_all(src, "greeter.kiln")){
        auto r = evaluator.evaluate(form, bindings, compiler.root_env("greeter.kiln"));
        if(!r){
            Diagnostic d = to_diagnostic(r.takeError());
            std::cerr << d.code << ": " << format(d) << "\n";
            return 1;
        }
        bindings = std::move(r->bindings);
    }

    auto loaded = CodeServer::global().find("Greeter");
    if(!loaded){ std::cerr << "Greeter was not loaded\n"; return 2; }
    for(InfoKind k : {InfoKind::Functions, InfoKind::Exports, InfoKind::Checksum}){
        auto answer = loaded->artifact.info(k);
        if(!answer){ std::cerr << format(to_diagnostic(answer.takeError())) << "\n"; return 3; }
        std::cout << "__info__(" << info_kind_name(k) << ") = " << *answer << "\n";
    }
    std::cout << "hooks example OK\n";
    return 0;
}
