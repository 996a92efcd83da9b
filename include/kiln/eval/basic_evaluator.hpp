// Evaluator for the module-definition forms used by source files and tests:
//
//   (do form...)                      sequence, value of the last form
//   (quote form)                      form, unevaluated
//   (let [name value ...] form...)    scoped bindings
//   (def name [params] body...)       also defp, defmacro, defmacrop
//   (@ :key value) / (@ :key)         put / get a module attribute (value is literal)
//   (register-attribute :key :accumulate true :persist true)
//   (delete-attribute :key)
//   (defmodule Name form...)          nested module compile
//   (call Module function args...)    dispatched call
//   (compiler-modules)                modules being compiled, innermost last
//   (raise "message")
//
// Any other list with a symbol head is a call to a function of the current
// module, which does not exist yet while the module is being compiled.
#pragma once
#include "kiln/collaborators.hpp"

namespace kiln::eval {

// Frames the evaluator adds to errors it raises; pruned from hook errors.
inline constexpr const char* InternalFrameModule = "kiln.eval";

class BasicEvaluator : public Evaluator {
public:
    explicit BasicEvaluator(Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

    llvm::Expected<EvalResult> evaluate(const node_ptr& form, const Bindings& bindings, const Env& env) override;

private:
    struct State {
        Bindings bindings;
        Env env;
    };

    llvm::Expected<node_ptr> eval(const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_list(const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_body(const std::vector<node_ptr>& forms, size_t from, State& st);
    llvm::Expected<node_ptr> eval_def(const std::string& head, const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_attribute(const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_register_attribute(const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_defmodule(const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_call(const node_ptr& form, State& st);
    llvm::Expected<node_ptr> eval_let(const node_ptr& form, State& st);

    Dispatcher& dispatcher_;
};

} // namespace kiln::eval
