#include "kiln/docs.hpp"
#include "kiln/registry.hpp"
#include "kiln/typespec.hpp"

namespace kiln {

bool is_doc_key(const std::string& key) {
    return key == "doc" || key == "typedoc" || key == "moduledoc";
}

node_ptr doc_entry(int line, node_ptr text) {
    return node_vec({n_i64(line), text ? std::move(text) : n_nil()});
}

int doc_line(const node_ptr& entry) {
    if (!entry) return -1;
    auto& el = elements(*entry);
    if (el.size() != 2 || !std::holds_alternative<int64_t>(el[0]->data)) return -1;
    return static_cast<int>(std::get<int64_t>(el[0]->data));
}

node_ptr doc_text(const node_ptr& entry) {
    if (!entry) return n_nil();
    auto& el = elements(*entry);
    return el.size() == 2 ? el[1] : entry;
}

llvm::Error consume_pending_docs(ModuleEntry& entry, const std::string& key, const node_ptr& value, int line) {
    std::lock_guard<std::recursive_mutex> lock(entry.mutex());
    auto& attrs = entry.attributes();
    if (key == "type" || key == "typep" || key == "opaque") {
        auto pending = attrs.read("typedoc");
        if (!pending) return llvm::Error::success();
        auto decl = parse_type(key, value, line);
        if (!decl) return decl.takeError();
        // Private types are never documented; the pending doc is dropped.
        if (decl->exported())
            entry.docs().types.push_back(DocEntry{key, decl->id, doc_line(*pending), doc_text(*pending)});
        attrs.erase("typedoc");
        return llvm::Error::success();
    }
    if (key == "callback" || key == "macrocallback") {
        auto pending = attrs.read("doc");
        if (!pending) return llvm::Error::success();
        auto decl = parse_spec(key, value, line);
        if (!decl) return decl.takeError();
        entry.docs().callbacks.push_back(DocEntry{key, decl->id, doc_line(*pending), doc_text(*pending)});
        attrs.erase("doc");
    }
    return llvm::Error::success();
}

namespace {

llvm::Expected<NameArity> defined_id(const Call& call) {
    // args: kind name arity clause
    if (call.args.size() != 4 || !std::holds_alternative<int64_t>(call.args[2]->data))
        return make_error(codes::InvalidAttribute,
            "on-definition hook " + call.module + "." + call.function + " received malformed arguments");
    return NameArity{name_of(call.args[1]), static_cast<int>(std::get<int64_t>(call.args[2]->data))};
}

} // namespace

llvm::Error compile_doc_hook(ModuleEntry& entry, const Call& call, const Env&) {
    auto id = defined_id(call);
    if (!id) return id.takeError();
    std::lock_guard<std::recursive_mutex> lock(entry.mutex());
    if (auto err = entry.ensure_open("compile-doc")) return err;
    auto& attrs = entry.attributes();
    auto pending = attrs.read("doc");
    if (!pending) return llvm::Error::success();
    if (Definition* def = entry.definitions().find(*id); def && is_public(def->kind))
        def->doc = *pending;
    // @doc on a private definition is discarded.
    attrs.erase("doc");
    return llvm::Error::success();
}

llvm::Error delete_doc_hook(ModuleEntry& entry, const Call& call, const Env&) {
    auto id = defined_id(call);
    if (!id) return id.takeError();
    std::lock_guard<std::recursive_mutex> lock(entry.mutex());
    if (auto err = entry.ensure_open("delete-doc")) return err;
    entry.attributes().erase("doc");
    return llvm::Error::success();
}

std::vector<Diagnostic> unused_doc_warnings(const AttributeStore& attrs, const std::string& file) {
    std::vector<Diagnostic> out;
    for (const char* key : {"doc", "typedoc"}) {
        auto pending = attrs.read(key);
        if (!pending) continue;
        Diagnostic d;
        d.code = codes::UnusedDocAttribute;
        d.message = std::string("module attribute @") + key + " was set but no definition follows it";
        d.file = file;
        d.line = doc_line(*pending);
        out.push_back(std::move(d));
    }
    return out;
}

namespace {

node_ptr doc_entry_form(const DocEntry& e) {
    return node_map({
        kvp(n_kw("kind"), n_kw(e.kind)),
        kvp(n_kw("name"), n_sym(e.id.name)),
        kvp(n_kw("arity"), n_i64(e.id.arity)),
        kvp(n_kw("line"), n_i64(e.line)),
        kvp(n_kw("doc"), e.text ? e.text : n_nil())});
}

node_ptr signature(const Definition& def) {
    if (def.clauses.empty() || !def.clauses.front()) return node_vec();
    auto& el = elements(*def.clauses.front());
    if (!el.empty() && is_vector(*el.front())) return el.front();
    return node_vec();
}

} // namespace

node_ptr build_docs(const ModuleEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(entry.mutex());
    auto defs = node_vec();
    for (auto& [id, def] : entry.definitions().all()) {
        if (!is_public(def.kind)) continue;
        defs << node_map({
            kvp(n_kw("kind"), n_kw(def_kind_name(def.kind))),
            kvp(n_kw("name"), n_sym(id.name)),
            kvp(n_kw("arity"), n_i64(id.arity)),
            kvp(n_kw("line"), n_i64(def.line)),
            kvp(n_kw("signature"), signature(def)),
            kvp(n_kw("doc"), def.doc ? doc_text(def.doc) : n_nil())});
    }
    auto callbacks = node_vec();
    for (auto& e : entry.docs().callbacks) callbacks << doc_entry_form(e);
    auto types = node_vec();
    for (auto& e : entry.docs().types) types << doc_entry_form(e);

    auto moduledoc = entry.attributes().read("moduledoc");
    return node_tagged("kiln/docs-v1", node_map({
        kvp(n_kw("module"), n_sym(entry.name())),
        kvp(n_kw("moduledoc"), moduledoc ? *moduledoc : n_nil()),
        kvp(n_kw("docs"), defs),
        kvp(n_kw("callback-docs"), callbacks),
        kvp(n_kw("type-docs"), types)}));
}

} // namespace kiln
