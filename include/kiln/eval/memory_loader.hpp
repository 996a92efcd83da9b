#pragma once
#include "kiln/code_server.hpp"
#include "kiln/collaborators.hpp"

#include <string>

namespace kiln::eval {

// Validates an artifact (container, module name, bitcode) and records it in
// the code server. `origin` is reported by redefinition warnings; empty means
// the module was defined in memory.
class MemoryLoader : public Loader {
public:
    explicit MemoryLoader(CodeServer& code_server = CodeServer::global(), std::string origin = {})
        : code_server_(code_server), origin_(std::move(origin)) {}

    llvm::Error load(const std::string& module, const Artifact& artifact) override;

private:
    CodeServer& code_server_;
    std::string origin_;
};

} // namespace kiln::eval
