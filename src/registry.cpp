#include "kiln/registry.hpp"
#include "kiln/diagnostics.hpp"
#include "kiln/options.hpp"

#include <algorithm>
#include <functional>

namespace kiln {

const char* phase_name(Phase p) {
    switch (p) {
    case Phase::Evaluating: return "evaluating";
    case Phase::BeforeHooks: return "before-hooks";
    case Phase::Assembling: return "assembling";
    case Phase::Building: return "building";
    case Phase::AfterHooks: return "after-hooks";
    case Phase::Closed: return "closed";
    }
    return "closed";
}

ModuleEntry::ModuleEntry(std::string name, Location loc, uint64_t session)
    : name_(std::move(name)), loc_(std::move(loc)), session_(session),
      attrs_(std::make_unique<AttributeStore>()), defs_(std::make_unique<DefinitionsTable>()),
      docs_(std::make_unique<DocTable>()) {}

llvm::Error ModuleEntry::ensure_open(const std::string& operation) const {
    if (!closed()) return llvm::Error::success();
    return make_error(codes::InvalidPhase, operation + " called for module " + name_ + " which is already closed");
}

void ModuleEntry::add_warning(Diagnostic d) {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    warnings_.push_back(std::move(d));
}

std::vector<Diagnostic> ModuleEntry::warnings() const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return warnings_;
}

void ModuleEntry::close() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    set_phase(Phase::Closed);
    attrs_.reset();
    defs_.reset();
    docs_.reset();
}

ModuleHandle::ModuleHandle(ModuleHandle&& o) noexcept
    : registry_(o.registry_), entry_(std::move(o.entry_)) {
    o.registry_ = nullptr;
}

ModuleHandle& ModuleHandle::operator=(ModuleHandle&& o) noexcept {
    if (this != &o) {
        close();
        registry_ = o.registry_;
        entry_ = std::move(o.entry_);
        o.registry_ = nullptr;
    }
    return *this;
}

void ModuleHandle::close() {
    if (!entry_) return;
    if (registry_) registry_->close(entry_);
    entry_.reset();
    registry_ = nullptr;
}

std::optional<node_ptr> ModuleHandle::get_attribute(const std::string& key) const {
    if (!entry_) return std::nullopt;
    std::lock_guard<std::recursive_mutex> lock(entry_->mutex());
    if (entry_->closed()) return std::nullopt;
    return entry_->attributes().read(key);
}

ModuleRegistry& ModuleRegistry::global() {
    static ModuleRegistry registry;
    return registry;
}

const std::vector<std::string>& ModuleRegistry::reserved_names() {
    static const std::vector<std::string> names = {
        "Kiln", "Kiln.Kiln", "Any", "BitString", "Function", "PID", "Reference"};
    return names;
}

bool ModuleRegistry::is_reserved(const std::string& name) {
    auto& r = reserved_names();
    return std::find(r.begin(), r.end(), name) != r.end();
}

ModuleRegistry::Shard& ModuleRegistry::shard_for(const std::string& name) const {
    return shards_[std::hash<std::string>{}(name) % ShardCount];
}

llvm::Expected<ModuleHandle> ModuleRegistry::open(const std::string& name, Location loc, uint64_t session) {
    if (is_reserved(name))
        return make_error(codes::ModuleReserved, "module " + name + " is reserved and cannot be defined", loc.file, loc.line);
    auto& shard = shard_for(name);
    std::lock_guard<std::mutex> lock(shard.mu);
    auto it = shard.entries.find(name);
    if (it != shard.entries.end()) {
        const Location& prev = it->second->location();
        Diagnostic d;
        d.code = codes::ModuleAlreadyDefining;
        d.message = "cannot define module " + name + " because it is currently being defined in " +
                    prev.file + ":" + std::to_string(prev.line);
        d.file = loc.file;
        d.line = loc.line;
        return make_error(std::move(d));
    }
    auto entry = std::make_shared<ModuleEntry>(name, std::move(loc), session);
    shard.entries.emplace(name, entry);
    if (debug_enabled()) std::fprintf(stderr, "[dbg][registry] open %s\n", name.c_str());
    return ModuleHandle(this, std::move(entry));
}

void ModuleRegistry::close(const std::shared_ptr<ModuleEntry>& entry) {
    auto& shard = shard_for(entry->name());
    {
        std::lock_guard<std::mutex> lock(shard.mu);
        auto it = shard.entries.find(entry->name());
        if (it != shard.entries.end() && it->second == entry) shard.entries.erase(it);
    }
    entry->close();
    if (debug_enabled()) std::fprintf(stderr, "[dbg][registry] close %s\n", entry->name().c_str());
}

bool ModuleRegistry::is_open(const std::string& name) const {
    auto& shard = shard_for(name);
    std::lock_guard<std::mutex> lock(shard.mu);
    return shard.entries.count(name) != 0;
}

std::shared_ptr<ModuleEntry> ModuleRegistry::lookup(const std::string& name) const {
    auto& shard = shard_for(name);
    std::lock_guard<std::mutex> lock(shard.mu);
    auto it = shard.entries.find(name);
    return it == shard.entries.end() ? nullptr : it->second;
}

std::optional<node_ptr> ModuleRegistry::get_attribute(const std::string& module, const std::string& key) const {
    auto entry = lookup(module);
    if (!entry) return std::nullopt;
    std::lock_guard<std::recursive_mutex> lock(entry->mutex());
    if (entry->closed()) return std::nullopt;
    return entry->attributes().read(key);
}

size_t ModuleRegistry::size() const {
    size_t n = 0;
    for (auto& s : shards_) {
        std::lock_guard<std::mutex> lock(s.mu);
        n += s.entries.size();
    }
    return n;
}

} // namespace kiln
