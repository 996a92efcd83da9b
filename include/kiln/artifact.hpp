// Compiled module artifact: an immutable chunked container.
//
// Layout (all integers big-endian):
//   "FOR1" u32(size of everything after this field) "KILN"
//   chunk*: id[4] u32(payload length) payload, zero-padded to a multiple of 4
//
// Base chunks written by the builder, in order:
//   "Loc "  file and line of the definition
//   "Modl"  module name
//   "ExpT"  exported (name arity) pairs
//   "Code"  LLVM bitcode with the function bodies and __info__/1
//   "Type"  type declarations
//   "Spec"  spec / callback declarations
//   "Attr"  persisted attributes
//   "CInf"  compile options
// Custom chunks (e.g. "Docs") are appended with with_chunk().
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln {

namespace chunk_ids {
inline constexpr const char* Location = "Loc ";
inline constexpr const char* Module = "Modl";
inline constexpr const char* Exports = "ExpT";
inline constexpr const char* Code = "Code";
inline constexpr const char* Types = "Type";
inline constexpr const char* Specs = "Spec";
inline constexpr const char* Attributes = "Attr";
inline constexpr const char* CompileInfo = "CInf";
inline constexpr const char* Docs = "Docs";
} // namespace chunk_ids

struct Chunk {
    std::string id;   // exactly four bytes
    std::string data;
};

// Queries answered by the injected __info__/1 function.
enum class InfoKind : uint32_t { Attributes, CompileOpts, Exports, Functions, Macros, Checksum, Module, NativeAddresses };
inline constexpr uint32_t InfoKindCount = 8;
const char* info_kind_name(InfoKind k);
std::optional<InfoKind> parse_info_kind(std::string_view name);

class Artifact {
public:
    Artifact() = default;

    // Build a container from chunks (ids must be four bytes; checked by with_chunk/from_chunks).
    static llvm::Expected<Artifact> from_chunks(const std::vector<Chunk>& chunks);
    // Adopt raw bytes after validating the container structure.
    static llvm::Expected<Artifact> from_bytes(std::string bytes);

    const std::string& bytes() const;
    bool empty() const { return !bytes_ || bytes_->empty(); }
    size_t size() const { return bytes_ ? bytes_->size() : 0; }

    llvm::Expected<std::vector<Chunk>> chunks() const;
    // Payload of the first chunk with this id.
    std::optional<std::string> find(std::string_view id) const;

    // New artifact with one more chunk appended; this value is unchanged.
    llvm::Expected<Artifact> with_chunk(std::string id, std::string payload) const;

    // Answer of __info__(kind), read out of the Code chunk.
    llvm::Expected<std::string> info(InfoKind kind) const;

private:
    explicit Artifact(std::string bytes);
    std::shared_ptr<const std::string> bytes_;
};

} // namespace kiln
