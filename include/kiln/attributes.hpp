// Per-module attribute store with a declare-before-use key policy table.
#pragma once
#include "kiln/form.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

struct KeyPolicy {
    bool accumulate = false; // writes append instead of replacing
    bool persist = false;    // values are emitted as attribute sections
};

class AttributeStore {
public:
    // Internal control keys. The policy table lives in these two entries as
    // lists of keywords, so a dump of the store describes its own configuration.
    static constexpr const char* AccumulateKey = "kiln.accumulate";
    static constexpr const char* PersistKey = "kiln.persist";

    struct Entry {
        const std::string& key;
        KeyPolicy policy;
        const std::vector<node_ptr>& values; // write order
    };

    class UserKeyRange {
    public:
        class iterator {
        public:
            using underlying = std::map<std::string, std::vector<node_ptr>>::const_iterator;
            iterator(const AttributeStore* s, underlying it) : store_(s), it_(it) { skip(); }
            Entry operator*() const { return Entry{it_->first, store_->policy(it_->first), it_->second}; }
            iterator& operator++() { ++it_; skip(); return *this; }
            bool operator==(const iterator& o) const { return it_ == o.it_; }
            bool operator!=(const iterator& o) const { return it_ != o.it_; }
        private:
            void skip() { while (it_ != store_->entries_.end() && store_->is_internal(it_->first)) ++it_; }
            const AttributeStore* store_;
            underlying it_;
        };
        explicit UserKeyRange(const AttributeStore* s) : store_(s) {}
        iterator begin() const { return iterator(store_, store_->entries_.begin()); }
        iterator end() const { return iterator(store_, store_->entries_.end()); }
    private:
        const AttributeStore* store_;
    };

    AttributeStore();

    // Fix the policy of a key. Fails once the key holds user data under a different policy.
    llvm::Error declare_key(const std::string& key, bool accumulate, bool persist);

    // Append (accumulating) or replace (single-value). Undeclared keys are single-value, not persisted.
    llvm::Error write(const std::string& key, node_ptr value);

    // Single-value keys: the value. Accumulating keys: a list, newest first.
    std::optional<node_ptr> read(const std::string& key) const;

    // Accumulated values in write order (a single value for single-value keys).
    const std::vector<node_ptr>& values(const std::string& key) const;

    bool contains(const std::string& key) const { return entries_.count(key) != 0; }
    void erase(const std::string& key);
    KeyPolicy policy(const std::string& key) const;
    bool is_internal(const std::string& key) const { return key == AccumulateKey || key == PersistKey; }

    // Lazy view over every non-internal key, in key order. Restartable.
    UserKeyRange user_keys() const { return UserKeyRange(this); }

    // Keys declared by the compiler when a module is opened.
    static const std::vector<std::string>& default_accumulating();
    static const std::vector<std::string>& default_persisted();

private:
    static bool has_keyword(const std::vector<node_ptr>& kws, const std::string& key);
    static void set_keyword(std::vector<node_ptr>& kws, const std::string& key, bool present);

    std::map<std::string, std::vector<node_ptr>> entries_;
};

} // namespace kiln
