// Documentation attributes: pending @doc/@typedoc consumption, the built-in
// on-definition doc hooks and the Docs chunk payload.
#pragma once
#include "kiln/attributes.hpp"
#include "kiln/collaborators.hpp"
#include "kiln/definitions.hpp"
#include "kiln/diagnostics.hpp"

#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

class ModuleEntry;

struct DocEntry {
    std::string kind; // "callback", "macrocallback", "type", "opaque", ...
    NameArity id;
    int line = -1;
    node_ptr text;
};

// Docs collected while the body runs that do not hang off a definition.
struct DocTable {
    std::vector<DocEntry> callbacks;
    std::vector<DocEntry> types;
};

bool is_doc_key(const std::string& key);

// Stored shape of @doc / @typedoc / @moduledoc values: [line text].
node_ptr doc_entry(int line, node_ptr text);
int doc_line(const node_ptr& entry);
node_ptr doc_text(const node_ptr& entry);

// Runs after `key` was written: a pending @typedoc is consumed by the type it
// documents and a pending @doc by a callback declaration.
llvm::Error consume_pending_docs(ModuleEntry& entry, const std::string& key, const node_ptr& value, int line);

// Built-in on-definition hooks registered under the Kiln.Module name.
llvm::Error compile_doc_hook(ModuleEntry& entry, const Call& call, const Env& env);
llvm::Error delete_doc_hook(ModuleEntry& entry, const Call& call, const Env& env);

// One UnusedDocAttribute warning per @doc / @typedoc still pending at assembly.
std::vector<Diagnostic> unused_doc_warnings(const AttributeStore& attrs, const std::string& file);

// #kiln/docs-v1 {...} form stored in the Docs chunk.
node_ptr build_docs(const ModuleEntry& entry);

} // namespace kiln
