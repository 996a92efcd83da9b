#include "kiln/artifact.hpp"
#include "kiln/diagnostics.hpp"

#include <functional>

#include <llvm/Bitcode/BitcodeReader.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/Support/Endian.h>
#include <llvm/Support/MemoryBuffer.h>

namespace kiln {

namespace {

constexpr size_t HeaderSize = 12; // "FOR1" size "KILN"

size_t padded(size_t n) { return (n + 3) & ~size_t(3); }

void put_u32(std::string& out, uint32_t v) {
    char buf[4];
    llvm::support::endian::write32be(buf, v);
    out.append(buf, 4);
}

uint32_t get_u32(const std::string& in, size_t off) {
    return llvm::support::endian::read32be(in.data() + off);
}

llvm::Error bad_container(const std::string& why) {
    return make_error(codes::LoadError, "malformed artifact: " + why);
}

// Walks the chunk list; stops at the first structural error.
llvm::Error walk(const std::string& bytes, const std::function<void(Chunk)>& visit) {
    if (bytes.size() < HeaderSize) return bad_container("truncated header");
    if (bytes.compare(0, 4, "FOR1") != 0) return bad_container("missing FOR1 magic");
    if (get_u32(bytes, 4) != bytes.size() - 8) return bad_container("size field does not match");
    if (bytes.compare(8, 4, "KILN") != 0) return bad_container("missing KILN form type");
    size_t off = HeaderSize;
    while (off < bytes.size()) {
        if (bytes.size() - off < 8) return bad_container("truncated chunk header");
        Chunk c;
        c.id = bytes.substr(off, 4);
        uint32_t len = get_u32(bytes, off + 4);
        off += 8;
        if (bytes.size() - off < padded(len)) return bad_container("chunk " + c.id + " overruns the container");
        c.data = bytes.substr(off, len);
        off += padded(len);
        visit(std::move(c));
    }
    return llvm::Error::success();
}

} // namespace

const char* info_kind_name(InfoKind k) {
    switch (k) {
    case InfoKind::Attributes: return "attributes";
    case InfoKind::CompileOpts: return "compile-opts";
    case InfoKind::Exports: return "exports";
    case InfoKind::Functions: return "functions";
    case InfoKind::Macros: return "macros";
    case InfoKind::Checksum: return "checksum";
    case InfoKind::Module: return "module";
    case InfoKind::NativeAddresses: return "native-addresses";
    }
    return "unknown";
}

std::optional<InfoKind> parse_info_kind(std::string_view name) {
    for (uint32_t i = 0; i < InfoKindCount; ++i) {
        auto k = static_cast<InfoKind>(i);
        if (name == info_kind_name(k)) return k;
    }
    return std::nullopt;
}

Artifact::Artifact(std::string bytes) : bytes_(std::make_shared<const std::string>(std::move(bytes))) {}

const std::string& Artifact::bytes() const {
    static const std::string empty;
    return bytes_ ? *bytes_ : empty;
}

llvm::Expected<Artifact> Artifact::from_chunks(const std::vector<Chunk>& chunks) {
    std::string body = "KILN";
    for (auto& c : chunks) {
        if (c.id.size() != 4)
            return make_error(codes::BuildError, "chunk id '" + c.id + "' must be exactly four bytes");
        if (c.data.size() > UINT32_MAX)
            return make_error(codes::BuildError, "chunk " + c.id + " is too large");
        body += c.id;
        put_u32(body, static_cast<uint32_t>(c.data.size()));
        body += c.data;
        body.append(padded(c.data.size()) - c.data.size(), '\0');
    }
    std::string out = "FOR1";
    put_u32(out, static_cast<uint32_t>(body.size()));
    out += body;
    return Artifact(std::move(out));
}

llvm::Expected<Artifact> Artifact::from_bytes(std::string bytes) {
    if (auto err = walk(bytes, [](Chunk) {})) return std::move(err);
    return Artifact(std::move(bytes));
}

llvm::Expected<std::vector<Chunk>> Artifact::chunks() const {
    std::vector<Chunk> out;
    if (auto err = walk(bytes(), [&](Chunk c) { out.push_back(std::move(c)); })) return std::move(err);
    return out;
}

std::optional<std::string> Artifact::find(std::string_view id) const {
    auto cs = chunks();
    if (!cs) {
        llvm::consumeError(cs.takeError());
        return std::nullopt;
    }
    for (auto& c : *cs)
        if (c.id == id) return c.data;
    return std::nullopt;
}

llvm::Expected<Artifact> Artifact::with_chunk(std::string id, std::string payload) const {
    auto cs = chunks();
    if (!cs) return cs.takeError();
    cs->push_back(Chunk{std::move(id), std::move(payload)});
    return from_chunks(*cs);
}

llvm::Expected<std::string> Artifact::info(InfoKind kind) const {
    auto code = find(chunk_ids::Code);
    if (!code) return make_error(codes::LoadError, "artifact has no Code chunk");
    llvm::LLVMContext ctx;
    auto buf = llvm::MemoryBuffer::getMemBuffer(llvm::StringRef(*code), "Code", false);
    auto mod = llvm::parseBitcodeFile(buf->getMemBufferRef(), ctx);
    if (!mod) return make_error(codes::LoadError, "unreadable bitcode: " + llvm::toString(mod.takeError()));
    std::string gname = std::string("__info__.") + info_kind_name(kind);
    auto* gv = (*mod)->getNamedGlobal(gname);
    if (!gv || !gv->hasInitializer())
        return make_error(codes::LoadError, "__info__ has no answer for " + std::string(info_kind_name(kind)));
    auto* arr = llvm::dyn_cast<llvm::ConstantDataArray>(gv->getInitializer());
    if (!arr || !arr->isCString())
        return make_error(codes::LoadError, "__info__ answer for " + std::string(info_kind_name(kind)) + " is not a string");
    return arr->getAsCString().str();
}

} // namespace kiln
