#include "kiln/attributes.hpp"
#include "kiln/diagnostics.hpp"

#include <algorithm>

namespace kiln {

const std::vector<std::string>& AttributeStore::default_accumulating() {
    static const std::vector<std::string> keys = {
        "before-compile", "after-compile", "on-definition", "derive",
        "spec", "type", "typep", "opaque", "callback", "macrocallback", "optional-callbacks",
        "behaviour", "on-load", "compile", "external-resource", "dialyzer"};
    return keys;
}

const std::vector<std::string>& AttributeStore::default_persisted() {
    static const std::vector<std::string> keys = {
        "vsn", "behaviour", "on-load", "compile", "external-resource", "dialyzer"};
    return keys;
}

AttributeStore::AttributeStore() {
    auto& acc = entries_[AccumulateKey];
    auto& per = entries_[PersistKey];
    for (auto& k : default_accumulating()) acc.push_back(n_kw(k));
    for (auto& k : default_persisted()) per.push_back(n_kw(k));
}

bool AttributeStore::has_keyword(const std::vector<node_ptr>& kws, const std::string& key) {
    return std::any_of(kws.begin(), kws.end(), [&](const node_ptr& k) { return name_of(k) == key; });
}

void AttributeStore::set_keyword(std::vector<node_ptr>& kws, const std::string& key, bool present) {
    auto it = std::find_if(kws.begin(), kws.end(), [&](const node_ptr& k) { return name_of(k) == key; });
    if (present && it == kws.end()) kws.push_back(n_kw(key));
    else if (!present && it != kws.end()) kws.erase(it);
}

KeyPolicy AttributeStore::policy(const std::string& key) const {
    KeyPolicy p;
    p.accumulate = has_keyword(entries_.at(AccumulateKey), key);
    p.persist = has_keyword(entries_.at(PersistKey), key);
    return p;
}

llvm::Error AttributeStore::declare_key(const std::string& key, bool accumulate, bool persist) {
    if (is_internal(key))
        return make_error(codes::InvalidAttribute, "attribute " + key + " is reserved for the compiler");
    KeyPolicy current = policy(key);
    auto it = entries_.find(key);
    bool holds_data = it != entries_.end() && !it->second.empty();
    if (holds_data && current.accumulate != accumulate)
        return make_error(codes::InvalidAttribute,
            "cannot change the accumulate policy of @" + key + " after it has been written");
    set_keyword(entries_[AccumulateKey], key, accumulate);
    set_keyword(entries_[PersistKey], key, persist);
    if (accumulate && it == entries_.end()) entries_[key];
    return llvm::Error::success();
}

llvm::Error AttributeStore::write(const std::string& key, node_ptr value) {
    if (is_internal(key))
        return make_error(codes::InvalidAttribute, "attribute " + key + " is reserved for the compiler");
    if (!value) value = n_nil();
    auto& slot = entries_[key];
    if (policy(key).accumulate) slot.push_back(std::move(value));
    else slot.assign(1, std::move(value));
    return llvm::Error::success();
}

std::optional<node_ptr> AttributeStore::read(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (!policy(key).accumulate) {
        if (it->second.empty()) return std::nullopt;
        return it->second.front();
    }
    auto out = node_list();
    auto& elems = std::get<list>(out->data).elems;
    elems.assign(it->second.rbegin(), it->second.rend());
    return out;
}

const std::vector<node_ptr>& AttributeStore::values(const std::string& key) const {
    static const std::vector<node_ptr> empty;
    auto it = entries_.find(key);
    return it == entries_.end() ? empty : it->second;
}

void AttributeStore::erase(const std::string& key) {
    if (is_internal(key)) return;
    entries_.erase(key);
}

} // namespace kiln
