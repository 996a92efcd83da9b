// Process-wide table of loaded modules, and the channel a listening session
// receives "module available" notifications on.
#pragma once
#include "kiln/artifact.hpp"
#include "kiln/definitions.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

class CodeServer {
public:
    struct Loaded {
        Artifact artifact;
        std::string origin; // file the module was loaded from; empty when defined in memory
    };

    static CodeServer& global();

    void insert(const std::string& module, Artifact artifact, std::string origin = {});
    bool erase(const std::string& module);
    bool is_loaded(const std::string& module) const;
    std::optional<Loaded> find(const std::string& module) const;
    // Where a loaded module came from; nullopt when not loaded, "" when defined in memory.
    std::optional<std::string> origin(const std::string& module) const;
    // Exported (name, arity) pairs read back from the ExpT chunk.
    std::vector<NameArity> exports(const std::string& module) const;
    bool exports_function(const std::string& module, const NameArity& id) const;
    std::vector<std::string> modules() const;

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Loaded> loaded_;
};

struct ModuleAvailable {
    std::string file;
    std::string module;
    Artifact artifact;
};

// Append-only. Readers keep their own cursor.
class ModuleChannel {
public:
    void publish(ModuleAvailable m);
    size_t size() const;
    std::vector<ModuleAvailable> snapshot() const;
    // Block until entry `cursor` exists or the timeout passes.
    std::optional<ModuleAvailable> wait_at(size_t cursor, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    std::vector<ModuleAvailable> log_;
};

// Printed forms of the ExpT payload.
std::string encode_exports(const std::vector<NameArity>& exports);
std::vector<NameArity> decode_exports(const std::string& payload);

} // namespace kiln
