// Functions and macros defined by a module body.
#pragma once
#include "kiln/form.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

enum class DefKind { Def, Defp, Defmacro, Defmacrop };

const char* def_kind_name(DefKind k);
bool is_public(DefKind k);
bool is_macro(DefKind k);

struct NameArity {
    std::string name;
    int arity = 0;
    bool operator<(const NameArity& o) const { return name != o.name ? name < o.name : arity < o.arity; }
    bool operator==(const NameArity& o) const { return name == o.name && arity == o.arity; }
    std::string str() const { return name + '/' + std::to_string(arity); }
};

// Dispatch name of a macro: MACRO-name with one extra (context) argument.
NameArity macro_dispatch(const NameArity& macro);

struct Definition {
    DefKind kind = DefKind::Def;
    NameArity id;
    int line = -1;
    std::vector<node_ptr> clauses; // each clause is ([params] body...)
    node_ptr doc;                  // [line "text"] attached by the doc hook, or null
};

// Partition of a frozen table; every list sorted.
struct UnwrappedDefinitions {
    std::vector<NameArity> def, defp, defmacro, defmacrop;
    std::vector<NameArity> exports; // def + dispatch names of defmacro
    std::vector<NameArity> all;
};

class DefinitionsTable {
public:
    // Add a clause; returns true through `is_new` when (name, arity) was not defined before.
    llvm::Error define(DefKind kind, const NameArity& id, node_ptr clause, int line, bool* is_new = nullptr);

    const Definition* find(const NameArity& id) const;
    Definition* find(const NameArity& id);
    const std::map<NameArity, Definition>& all() const { return defs_; }
    bool empty() const { return defs_.empty(); }

    // After freezing, define() fails: after-compile hooks may not add definitions.
    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    UnwrappedDefinitions unwrap() const;

private:
    // An existing definition that would share a symbol with `id` through a
    // macro dispatch name, or null.
    const Definition* dispatch_clash(DefKind kind, const NameArity& id) const;

    std::map<NameArity, Definition> defs_;
    bool frozen_ = false;
};

} // namespace kiln
