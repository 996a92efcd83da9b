// Emits the Code chunk (LLVM bitcode) and packs every section into an Artifact.
#pragma once
#include "kiln/artifact.hpp"
#include "kiln/assembler.hpp"

#include <functional>
#include <string>
#include <vector>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/Support/Error.h>

namespace kiln {

struct BuildOptions {
    // Compile flags from @compile. Recognized: :optimize (run the O2 pipeline),
    // :no-verify (skip the IR verifier).
    std::vector<node_ptr> flags;
    std::string target_triple; // empty = host default
    bool has_flag(const std::string& name) const;
};

// Invoked with the finished artifact (docs included) before build() returns.
using BuiltCallback = std::function<llvm::Error(const Artifact&)>;

class ArtifactBuilder {
public:
    // Build the LLVM module for these sections: one dispatch stub per definition
    // plus __info__/1 answering from constant strings.
    std::unique_ptr<llvm::Module> emit_module(const ModuleSections& s, const BuildOptions& opts, llvm::LLVMContext& ctx) const;

    llvm::Expected<std::string> emit_code(const ModuleSections& s, const BuildOptions& opts) const;

    llvm::Expected<Artifact> build(const ModuleSections& s, const BuildOptions& opts,
                                   const BuiltCallback& on_built = {}) const;
};

// Symbol of the runtime entry every stub calls:
//   i8* kiln_rt_dispatch(i8* module, i8* clauses, i32 arity, i8** argv)
inline constexpr const char* RuntimeDispatchSymbol = "kiln_rt_dispatch";

// LLVM symbol of a definition's stub: "name/arity" (macros under their dispatch name).
std::string stub_symbol(const Definition& def);

} // namespace kiln
