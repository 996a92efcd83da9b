#include "kiln/typespec.hpp"
#include "kiln/diagnostics.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace kiln {

namespace {

llvm::Error malformed(const std::string& kind, const node_ptr& value, int line, const std::string& shape) {
    return make_error(codes::InvalidAttribute,
        "invalid @" + kind + " " + to_string(value) + ", expected " + shape, {}, line);
}

int line_of(const node_ptr& value, int fallback) {
    int l = line(value);
    return l >= 0 ? l : fallback;
}

// (name [params] tail) where tail is exactly one form.
bool split_decl(const node_ptr& value, std::string& name, const std::vector<node_ptr>*& params, node_ptr& tail) {
    if (!value || !is_list(*value)) return false;
    auto& el = elements(*value);
    if (el.size() != 3 || !is_symbol(*el[0]) || !is_vector(*el[1])) return false;
    name = name_of(el[0]);
    params = &elements(*el[1]);
    tail = el[2];
    return true;
}

} // namespace

llvm::Expected<SpecDecl> parse_spec(const std::string& kind, const node_ptr& value, int fallback_line) {
    std::string name;
    const std::vector<node_ptr>* args = nullptr;
    node_ptr result;
    int l = line_of(value, fallback_line);
    if (!split_decl(value, name, args, result))
        return malformed(kind, value, l, "(name [argument-types] result-type)");
    SpecDecl d;
    d.kind = kind;
    d.id = NameArity{name, static_cast<int>(args->size())};
    d.line = l;
    d.clauses.push_back(SpecClause{*args, result});
    return d;
}

llvm::Expected<TypeDecl> parse_type(const std::string& kind, const node_ptr& value, int fallback_line) {
    std::string name;
    const std::vector<node_ptr>* params = nullptr;
    node_ptr definition;
    int l = line_of(value, fallback_line);
    if (!split_decl(value, name, params, definition))
        return malformed(kind, value, l, "(name [parameters] definition)");
    TypeDecl t;
    t.kind = kind;
    t.id = NameArity{name, static_cast<int>(params->size())};
    t.line = l;
    t.definition = definition;
    for (auto& p : *params) {
        if (!is_symbol(*p)) return malformed(kind, value, l, "type parameters to be symbols");
        t.params.push_back(name_of(p));
    }
    return t;
}

llvm::Expected<std::vector<NameArity>> parse_optional_callbacks(const node_ptr& value) {
    std::vector<NameArity> out;
    if (!value || !is_vector(*value))
        return malformed("optional-callbacks", value, line(value), "a vector of [name arity] pairs");
    for (auto& e : elements(*value)) {
        auto& pair = elements(*e);
        if (!is_vector(*e) || pair.size() != 2 || !is_symbol(*pair[0]) ||
            !std::holds_alternative<int64_t>(pair[1]->data))
            return malformed("optional-callbacks", value, line(value), "a vector of [name arity] pairs");
        out.push_back(NameArity{name_of(pair[0]), static_cast<int>(std::get<int64_t>(pair[1]->data))});
    }
    return out;
}

std::vector<SpecDecl> group_specs(const std::vector<SpecDecl>& singles) {
    std::map<std::tuple<std::string, std::string, int>, SpecDecl> grouped;
    for (auto& s : singles) {
        auto key = std::make_tuple(s.kind, s.id.name, s.id.arity);
        auto it = grouped.find(key);
        if (it == grouped.end()) {
            grouped.emplace(key, s);
            continue;
        }
        auto& g = it->second;
        g.clauses.insert(g.clauses.end(), s.clauses.begin(), s.clauses.end());
        if (s.line >= 0 && (g.line < 0 || s.line < g.line)) g.line = s.line;
    }
    std::vector<SpecDecl> out;
    out.reserve(grouped.size());
    for (auto& [_, d] : grouped) out.push_back(std::move(d));
    return out;
}

SpecDecl as_macro_spec(const SpecDecl& s) {
    SpecDecl m = s;
    m.id = macro_dispatch(s.id);
    for (auto& c : m.clauses) c.args.insert(c.args.begin(), n_sym("term"));
    return m;
}

node_ptr to_form(const SpecDecl& s) {
    auto clauses = node_vec();
    for (auto& c : s.clauses)
        clauses << node_map({kvp(n_kw("args"), node_vec(c.args)), kvp(n_kw("return"), c.result)});
    return node_map({
        kvp(n_kw("kind"), n_kw(s.kind)),
        kvp(n_kw("name"), n_sym(s.id.name)),
        kvp(n_kw("arity"), n_i64(s.id.arity)),
        kvp(n_kw("line"), n_i64(s.line)),
        kvp(n_kw("clauses"), clauses)});
}

node_ptr to_form(const TypeDecl& t) {
    auto params = node_vec();
    for (auto& p : t.params) params << n_sym(p);
    return node_map({
        kvp(n_kw("kind"), n_kw(t.kind)),
        kvp(n_kw("name"), n_sym(t.id.name)),
        kvp(n_kw("arity"), n_i64(t.id.arity)),
        kvp(n_kw("line"), n_i64(t.line)),
        kvp(n_kw("params"), params),
        kvp(n_kw("definition"), t.definition),
        kvp(n_kw("exported"), n_bool(t.exported()))});
}

} // namespace kiln
