#include "kiln/assembler.hpp"
#include "kiln/docs.hpp"

#include <algorithm>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/MD5.h>

namespace kiln {

namespace {

bool contains(const std::vector<NameArity>& sorted, const NameArity& id) {
    return std::binary_search(sorted.begin(), sorted.end(), id);
}

llvm::Error check_internal_functions(const ModuleSections& s) {
    auto def = std::find_if(s.definitions.begin(), s.definitions.end(),
                            [](const Definition& d) { return d.id == info_function(); });
    if (def == s.definitions.end()) return llvm::Error::success();
    return make_error(codes::InternalSymbolOverridden,
        std::string("cannot define ") + def_kind_name(def->kind) + " " + info_function().str() +
        " as it is automatically defined by the compiler", s.location.file, def->line);
}

llvm::Error collect_specs(const AttributeStore& attrs, ModuleSections& s) {
    std::vector<SpecDecl> singles;
    for (auto& v : attrs.values("spec")) {
        auto d = parse_spec("spec", v, s.location.line);
        if (!d) return d.takeError();
        if (contains(s.defs.defmacro, d->id))
            singles.push_back(as_macro_spec(*d));
        else if (contains(s.defs.def, d->id))
            singles.push_back(std::move(*d));
        // specs of private or undefined functions are dropped
    }
    for (auto& v : attrs.values("callback")) {
        auto d = parse_spec("callback", v, s.location.line);
        if (!d) return d.takeError();
        singles.push_back(std::move(*d));
    }
    std::vector<NameArity> macro_callbacks;
    for (auto& v : attrs.values("macrocallback")) {
        auto d = parse_spec("callback", v, s.location.line);
        if (!d) return d.takeError();
        macro_callbacks.push_back(d->id);
        singles.push_back(as_macro_spec(*d));
    }
    s.specs = group_specs(singles);

    std::sort(macro_callbacks.begin(), macro_callbacks.end());
    for (auto& v : attrs.values("optional-callbacks")) {
        auto ids = parse_optional_callbacks(v);
        if (!ids) return ids.takeError();
        for (auto& id : *ids)
            s.optional_callbacks.push_back(contains(macro_callbacks, id) ? macro_dispatch(id) : id);
    }
    std::sort(s.optional_callbacks.begin(), s.optional_callbacks.end());
    s.optional_callbacks.erase(std::unique(s.optional_callbacks.begin(), s.optional_callbacks.end()),
                               s.optional_callbacks.end());
    return llvm::Error::success();
}

llvm::Error collect_types(const AttributeStore& attrs, ModuleSections& s) {
    for (const char* kind : {"type", "typep", "opaque"}) {
        for (auto& v : attrs.values(kind)) {
            auto t = parse_type(kind, v, s.location.line);
            if (!t) return t.takeError();
            s.types.push_back(std::move(*t));
        }
    }
    std::stable_sort(s.types.begin(), s.types.end(),
                     [](const TypeDecl& a, const TypeDecl& b) { return a.id < b.id; });
    return llvm::Error::success();
}

llvm::Error collect_external_resources(const std::vector<node_ptr>& values, ModuleSections& s) {
    std::vector<std::string> paths;
    for (auto& v : values) {
        if (!v || !is_string(*v))
            return make_error(codes::InvalidExternalResource,
                "@external-resource must be a string, got: " + to_string(v), s.location.file, line(v));
        paths.push_back(std::get<std::string>(v->data));
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    for (auto& p : paths) s.attributes.push_back(AttributeSection{"external-resource", n_str(p)});
    return llvm::Error::success();
}

void flatten_into(const node_ptr& v, std::vector<node_ptr>& out) {
    if (v && (is_vector(*v) || is_list(*v))) {
        for (auto& e : elements(*v)) flatten_into(e, out);
        return;
    }
    out.push_back(v);
}

llvm::Error collect_attributes(const AttributeStore& attrs, ModuleSections& s) {
    for (auto entry : attrs.user_keys()) {
        if (!entry.policy.persist) continue;
        if (entry.key == "external-resource") {
            if (auto err = collect_external_resources(entry.values, s)) return err;
            continue;
        }
        for (auto& v : entry.values) s.attributes.push_back(AttributeSection{entry.key, v});
    }
    for (auto& v : attrs.values("compile")) flatten_into(v, s.compile_opts);
    return llvm::Error::success();
}

std::string checksum(const ModuleSections& s) {
    llvm::MD5 h;
    h.update(s.module);
    for (auto& e : s.exports) { h.update("\n"); h.update(e.str()); }
    for (auto& d : s.definitions) {
        h.update("\n");
        h.update(def_kind_name(d.kind));
        h.update(d.id.str());
        for (auto& c : d.clauses) h.update(to_string(c));
    }
    llvm::MD5::MD5Result r;
    h.final(r);
    llvm::SmallString<32> hex = r.digest();
    return std::string(hex.begin(), hex.end());
}

node_ptr id_vector(const std::vector<NameArity>& ids) {
    auto out = node_vec();
    for (auto& id : ids) out << node_vec({n_sym(id.name), n_i64(id.arity)});
    return out;
}

} // namespace

llvm::Expected<ModuleSections> assemble_module(ModuleEntry& entry, const CompilerOptions& opts,
                                               std::vector<Diagnostic>& warnings) {
    std::lock_guard<std::recursive_mutex> lock(entry.mutex());
    const AttributeStore& attrs = entry.attributes();

    ModuleSections s;
    s.module = entry.name();
    s.location = entry.location();

    if (opts.docs)
        for (auto& w : unused_doc_warnings(attrs, s.location.file)) warnings.push_back(std::move(w));

    s.defs = entry.definitions().unwrap();
    for (auto& [_, def] : entry.definitions().all()) s.definitions.push_back(def);
    if (auto err = check_internal_functions(s)) return std::move(err);

    s.exports = s.defs.exports;
    s.exports.insert(std::upper_bound(s.exports.begin(), s.exports.end(), info_function()), info_function());

    if (!opts.internal) {
        if (auto err = collect_specs(attrs, s)) return std::move(err);
        if (auto err = collect_types(attrs, s)) return std::move(err);
    }
    if (auto err = collect_attributes(attrs, s)) return std::move(err);

    if (opts.docs) s.docs = build_docs(entry);
    s.checksum = checksum(s);
    return s;
}

std::string info_answer(const ModuleSections& s, InfoKind kind) {
    switch (kind) {
    case InfoKind::Attributes: {
        auto out = node_vec();
        for (auto& a : s.attributes) out << node_vec({n_kw(a.key), a.value});
        return to_string(out);
    }
    case InfoKind::CompileOpts: return to_string(node_vec(s.compile_opts));
    case InfoKind::Exports: return to_string(id_vector(s.exports));
    case InfoKind::Functions: return to_string(id_vector(s.defs.def));
    case InfoKind::Macros: return to_string(id_vector(s.defs.defmacro));
    case InfoKind::Checksum: return to_string(n_str(s.checksum));
    case InfoKind::Module: return to_string(n_sym(s.module));
    case InfoKind::NativeAddresses: return to_string(node_vec());
    }
    return "nil";
}

} // namespace kiln
