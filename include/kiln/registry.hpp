// Registry of modules currently being compiled.
//
// A name maps to at most one open entry. Opening a name that is already open
// fails with ModuleAlreadyDefining; the entry (and its stores) goes away when
// its handle closes, on success or failure alike.
#pragma once
#include "kiln/attributes.hpp"
#include "kiln/definitions.hpp"
#include "kiln/docs.hpp"
#include "kiln/env.hpp"

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

enum class Phase { Evaluating, BeforeHooks, Assembling, Building, AfterHooks, Closed };
const char* phase_name(Phase p);

class ModuleEntry {
public:
    ModuleEntry(std::string name, Location loc, uint64_t session);

    const std::string& name() const { return name_; }
    const Location& location() const { return loc_; }
    uint64_t session() const { return session_; }

    // Guards the stores against concurrent introspection. Recursive because
    // built-in hooks write attributes from inside definition handling.
    std::recursive_mutex& mutex() const { return mu_; }

    // Valid until close().
    AttributeStore& attributes() { return *attrs_; }
    const AttributeStore& attributes() const { return *attrs_; }
    DefinitionsTable& definitions() { return *defs_; }
    const DefinitionsTable& definitions() const { return *defs_; }
    DocTable& docs() { return *docs_; }
    const DocTable& docs() const { return *docs_; }

    Phase phase() const { return phase_.load(); }
    void set_phase(Phase p) { phase_.store(p); }
    bool closed() const { return phase() == Phase::Closed; }
    // InvalidPhase once the entry is closed. Call with mutex() held before
    // touching the stores.
    llvm::Error ensure_open(const std::string& operation) const;

    // Set while on-definition hooks run so definitions they add do not re-trigger them.
    std::atomic<bool> in_definition_hook{false};

    void add_warning(Diagnostic d);
    std::vector<Diagnostic> warnings() const;

private:
    friend class ModuleRegistry;
    void close();

    std::string name_;
    Location loc_;
    uint64_t session_;
    mutable std::recursive_mutex mu_;
    std::unique_ptr<AttributeStore> attrs_;
    std::unique_ptr<DefinitionsTable> defs_;
    std::unique_ptr<DocTable> docs_;
    std::atomic<Phase> phase_{Phase::Evaluating};
    std::vector<Diagnostic> warnings_;
};

class ModuleRegistry;

// Exclusive ownership of an open entry. Closing is idempotent and also
// happens on destruction.
class ModuleHandle {
public:
    ModuleHandle() = default;
    ModuleHandle(ModuleHandle&& o) noexcept;
    ModuleHandle& operator=(ModuleHandle&& o) noexcept;
    ModuleHandle(const ModuleHandle&) = delete;
    ModuleHandle& operator=(const ModuleHandle&) = delete;
    ~ModuleHandle() { close(); }

    void close();
    bool is_open() const { return entry_ != nullptr; }
    ModuleEntry& entry() const { return *entry_; }
    const std::string& name() const { return entry_->name(); }
    Phase phase() const { return entry_ ? entry_->phase() : Phase::Closed; }
    std::optional<node_ptr> get_attribute(const std::string& key) const;

private:
    friend class ModuleRegistry;
    ModuleHandle(ModuleRegistry* r, std::shared_ptr<ModuleEntry> e) : registry_(r), entry_(std::move(e)) {}
    ModuleRegistry* registry_ = nullptr;
    std::shared_ptr<ModuleEntry> entry_;
};

class ModuleRegistry {
public:
    static ModuleRegistry& global();

    static const std::vector<std::string>& reserved_names();
    static bool is_reserved(const std::string& name);

    llvm::Expected<ModuleHandle> open(const std::string& name, Location loc, uint64_t session = 0);

    bool is_open(const std::string& name) const;
    // Shared reference to an open entry; null when the name is not open.
    std::shared_ptr<ModuleEntry> lookup(const std::string& name) const;
    std::optional<node_ptr> get_attribute(const std::string& module, const std::string& key) const;
    size_t size() const;

private:
    friend class ModuleHandle;
    void close(const std::shared_ptr<ModuleEntry>& entry);

    static constexpr size_t ShardCount = 16;
    struct Shard {
        mutable std::mutex mu;
        std::unordered_map<std::string, std::shared_ptr<ModuleEntry>> entries;
    };
    Shard& shard_for(const std::string& name) const;

    mutable std::array<Shard, ShardCount> shards_;
};

} // namespace kiln
