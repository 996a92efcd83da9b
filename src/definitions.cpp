#include "kiln/definitions.hpp"
#include "kiln/diagnostics.hpp"

#include <algorithm>

namespace kiln {

const char* def_kind_name(DefKind k) {
    switch (k) {
    case DefKind::Def: return "def";
    case DefKind::Defp: return "defp";
    case DefKind::Defmacro: return "defmacro";
    case DefKind::Defmacrop: return "defmacrop";
    }
    return "def";
}

bool is_public(DefKind k) { return k == DefKind::Def || k == DefKind::Defmacro; }
bool is_macro(DefKind k) { return k == DefKind::Defmacro || k == DefKind::Defmacrop; }

NameArity macro_dispatch(const NameArity& macro) { return NameArity{"MACRO-" + macro.name, macro.arity + 1}; }

llvm::Error DefinitionsTable::define(DefKind kind, const NameArity& id, node_ptr clause, int line, bool* is_new) {
    if (frozen_)
        return make_error(codes::InvalidPhase,
            "cannot define " + id.str() + ": the module has already been compiled", {}, line);
    auto it = defs_.find(id);
    if (it != defs_.end()) {
        if (it->second.kind != kind) {
            Diagnostic d;
            d.code = codes::DefinitionKindMismatch;
            d.message = std::string(def_kind_name(kind)) + " " + id.str() + " already defined as " + def_kind_name(it->second.kind);
            d.line = line;
            d.notes.push_back(Note{"previous definition", it->second.line});
            return make_error(std::move(d));
        }
        it->second.clauses.push_back(std::move(clause));
        if (is_new) *is_new = false;
        return llvm::Error::success();
    }
    if (const Definition* other = dispatch_clash(kind, id)) {
        Diagnostic d;
        d.code = codes::DefinitionKindMismatch;
        d.message = std::string(def_kind_name(kind)) + " " + id.str() + " clashes with " +
            def_kind_name(other->kind) + " " + other->id.str() + ", whose dispatch name is " +
            (is_macro(kind) ? macro_dispatch(id) : macro_dispatch(other->id)).str();
        d.line = line;
        d.notes.push_back(Note{"previous definition", other->line});
        return make_error(std::move(d));
    }
    Definition def;
    def.kind = kind;
    def.id = id;
    def.line = line;
    def.clauses.push_back(std::move(clause));
    defs_.emplace(id, std::move(def));
    if (is_new) *is_new = true;
    return llvm::Error::success();
}

const Definition* DefinitionsTable::dispatch_clash(DefKind kind, const NameArity& id) const {
    if (is_macro(kind)) {
        const Definition* fn = find(macro_dispatch(id));
        return fn && !is_macro(fn->kind) ? fn : nullptr;
    }
    static const std::string prefix = "MACRO-";
    if (id.arity < 1 || id.name.compare(0, prefix.size(), prefix) != 0) return nullptr;
    const Definition* macro = find(NameArity{id.name.substr(prefix.size()), id.arity - 1});
    return macro && is_macro(macro->kind) ? macro : nullptr;
}

const Definition* DefinitionsTable::find(const NameArity& id) const {
    auto it = defs_.find(id);
    return it == defs_.end() ? nullptr : &it->second;
}

Definition* DefinitionsTable::find(const NameArity& id) {
    auto it = defs_.find(id);
    return it == defs_.end() ? nullptr : &it->second;
}

UnwrappedDefinitions DefinitionsTable::unwrap() const {
    UnwrappedDefinitions out;
    // std::map iteration is already sorted by (name, arity)
    for (auto& [id, def] : defs_) {
        out.all.push_back(id);
        switch (def.kind) {
        case DefKind::Def: out.def.push_back(id); out.exports.push_back(id); break;
        case DefKind::Defp: out.defp.push_back(id); break;
        case DefKind::Defmacro: out.defmacro.push_back(id); out.exports.push_back(macro_dispatch(id)); break;
        case DefKind::Defmacrop: out.defmacrop.push_back(id); break;
        }
    }
    std::sort(out.exports.begin(), out.exports.end());
    return out;
}

} // namespace kiln
