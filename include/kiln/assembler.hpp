// Turns a finished module entry into the sections the artifact builder emits.
#pragma once
#include "kiln/artifact.hpp"
#include "kiln/definitions.hpp"
#include "kiln/diagnostics.hpp"
#include "kiln/options.hpp"
#include "kiln/registry.hpp"
#include "kiln/typespec.hpp"

#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

struct AttributeSection {
    std::string key;
    node_ptr value;
};

struct ModuleSections {
    std::string module;
    Location location;
    std::vector<NameArity> exports; // sorted; includes __info__/1
    UnwrappedDefinitions defs;
    std::vector<Definition> definitions; // sorted by (name, arity)
    std::vector<SpecDecl> specs;         // @spec and @callback, macro forms retargeted
    std::vector<NameArity> optional_callbacks;
    std::vector<TypeDecl> types;
    std::vector<AttributeSection> attributes; // persisted, in key order then write order
    std::vector<node_ptr> compile_opts;
    node_ptr docs; // null when docs are disabled
    std::string checksum;
};

inline const NameArity& info_function() {
    static const NameArity id{"__info__", 1};
    return id;
}

// Documentation warnings are appended to `warnings` before any fatal check
// runs, so they survive a failed assembly.
llvm::Expected<ModuleSections> assemble_module(ModuleEntry& entry, const CompilerOptions& opts,
                                               std::vector<Diagnostic>& warnings);

// Printed answer of __info__(kind) for these sections.
std::string info_answer(const ModuleSections& s, InfoKind kind);

} // namespace kiln
