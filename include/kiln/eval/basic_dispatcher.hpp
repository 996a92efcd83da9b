#pragma once
#include "kiln/code_server.hpp"
#include "kiln/collaborators.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace kiln::eval {

// Table-driven dispatcher keyed by "Module.function".
//
// Expanders: std::optional<node_ptr>(const Call&, const Env&)
//   Return a form to be evaluated in the caller, or std::nullopt when the
//   expander does not apply (a registered function is tried next).
// Functions: llvm::Expected<Env>(const Call&, const Env&)
//   Run the call and hand back the resulting environment.
// Calls matching neither fall back to the exports of loaded modules. Loaded
// code is not executed here: an exported callee is accepted as a no-op that
// returns the caller's env unchanged. Anything else is an UndefinedFunction
// error whose top frame names the callee.
class BasicDispatcher : public Dispatcher {
public:
    using ExpanderFn = std::function<std::optional<node_ptr>(const Call&, const Env&)>;
    using FunctionFn = std::function<llvm::Expected<Env>(const Call&, const Env&)>;

    explicit BasicDispatcher(CodeServer& code_server = CodeServer::global()) : code_server_(code_server) {}

    BasicDispatcher& add_expander(const std::string& module, const std::string& function, ExpanderFn fn) {
        expanders_[module + "." + function] = std::move(fn); return *this;
    }
    BasicDispatcher& add_function(const std::string& module, const std::string& function, FunctionFn fn) {
        functions_[module + "." + function] = std::move(fn); return *this;
    }

    llvm::Expected<Dispatch> dispatch(const Call& call, const Env& env) override;

private:
    CodeServer& code_server_;
    std::unordered_map<std::string, ExpanderFn> expanders_;
    std::unordered_map<std::string, FunctionFn> functions_;
};

} // namespace kiln::eval
