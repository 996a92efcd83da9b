#include "kiln/code_server.hpp"

#include <algorithm>

#include <llvm/Support/Endian.h>

namespace kiln {

CodeServer& CodeServer::global() {
    static CodeServer server;
    return server;
}

void CodeServer::insert(const std::string& module, Artifact artifact, std::string origin) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    loaded_[module] = Loaded{std::move(artifact), std::move(origin)};
}

bool CodeServer::erase(const std::string& module) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return loaded_.erase(module) != 0;
}

bool CodeServer::is_loaded(const std::string& module) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return loaded_.count(module) != 0;
}

std::optional<CodeServer::Loaded> CodeServer::find(const std::string& module) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = loaded_.find(module);
    if (it == loaded_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> CodeServer::origin(const std::string& module) const {
    auto loaded = find(module);
    if (!loaded) return std::nullopt;
    return loaded->origin;
}

std::vector<NameArity> CodeServer::exports(const std::string& module) const {
    auto loaded = find(module);
    if (!loaded) return {};
    auto payload = loaded->artifact.find(chunk_ids::Exports);
    return payload ? decode_exports(*payload) : std::vector<NameArity>{};
}

bool CodeServer::exports_function(const std::string& module, const NameArity& id) const {
    auto ex = exports(module);
    return std::binary_search(ex.begin(), ex.end(), id);
}

std::vector<std::string> CodeServer::modules() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<std::string> out;
    out.reserve(loaded_.size());
    for (auto& [name, _] : loaded_) out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}

void ModuleChannel::publish(ModuleAvailable m) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        log_.push_back(std::move(m));
    }
    cv_.notify_all();
}

size_t ModuleChannel::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return log_.size();
}

std::vector<ModuleAvailable> ModuleChannel::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return log_;
}

std::optional<ModuleAvailable> ModuleChannel::wait_at(size_t cursor, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [&] { return log_.size() > cursor; })) return std::nullopt;
    return log_[cursor];
}

// ExpT: u32 count, then per entry u32 arity, u32 name length, name bytes.
std::string encode_exports(const std::vector<NameArity>& exports) {
    using namespace llvm::support;
    std::string out;
    char buf[4];
    endian::write32be(buf, static_cast<uint32_t>(exports.size()));
    out.append(buf, 4);
    for (auto& e : exports) {
        endian::write32be(buf, static_cast<uint32_t>(e.arity));
        out.append(buf, 4);
        endian::write32be(buf, static_cast<uint32_t>(e.name.size()));
        out.append(buf, 4);
        out += e.name;
    }
    return out;
}

std::vector<NameArity> decode_exports(const std::string& payload) {
    using namespace llvm::support;
    std::vector<NameArity> out;
    if (payload.size() < 4) return out;
    uint32_t count = endian::read32be(payload.data());
    size_t off = 4;
    for (uint32_t i = 0; i < count && payload.size() - off >= 8; ++i) {
        uint32_t arity = endian::read32be(payload.data() + off);
        uint32_t len = endian::read32be(payload.data() + off + 4);
        off += 8;
        if (payload.size() - off < len) break;
        out.push_back(NameArity{payload.substr(off, len), static_cast<int>(arity)});
        off += len;
    }
    return out;
}

} // namespace kiln
