// Declarations carried by @spec, @callback, @macrocallback, @type, @typep,
// @opaque and @optional-callbacks.
//
//   (@ :spec (add [integer integer] integer))
//   (@ :type (pair [a b] (tuple a b)))
//   (@ :optional-callbacks [[init 1] [terminate 2]])
#pragma once
#include "kiln/definitions.hpp"
#include "kiln/form.hpp"

#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

struct SpecClause {
    std::vector<node_ptr> args;
    node_ptr result;
};

struct SpecDecl {
    std::string kind; // "spec" or "callback"
    NameArity id;
    int line = -1;
    std::vector<SpecClause> clauses;
};

struct TypeDecl {
    std::string kind; // "type", "typep" or "opaque"
    NameArity id;
    int line = -1;
    std::vector<std::string> params;
    node_ptr definition;
    bool exported() const { return kind != "typep"; }
};

// One written value -> one single-clause declaration. `fallback_line` is used
// when the value carries no line metadata.
llvm::Expected<SpecDecl> parse_spec(const std::string& kind, const node_ptr& value, int fallback_line);
llvm::Expected<TypeDecl> parse_type(const std::string& kind, const node_ptr& value, int fallback_line);
llvm::Expected<std::vector<NameArity>> parse_optional_callbacks(const node_ptr& value);

// Merge declarations sharing (kind, name, arity): clauses concatenate in
// input order and the smallest line wins. Result is sorted by key.
std::vector<SpecDecl> group_specs(const std::vector<SpecDecl>& singles);

// The macro dispatch form of a declaration: MACRO-name with a leading term argument.
SpecDecl as_macro_spec(const SpecDecl& s);

node_ptr to_form(const SpecDecl& s);
node_ptr to_form(const TypeDecl& t);

} // namespace kiln
