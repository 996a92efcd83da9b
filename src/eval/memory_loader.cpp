#include "kiln/eval/memory_loader.hpp"
#include "kiln/diagnostics.hpp"
#include "kiln/options.hpp"
#include "kiln/registry.hpp"

#include <llvm/Bitcode/BitcodeReader.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/Support/MemoryBuffer.h>

namespace kiln::eval {

llvm::Error MemoryLoader::load(const std::string& module, const Artifact& artifact) {
    if (ModuleRegistry::is_reserved(module))
        return make_error(codes::LoadError, "cannot load module " + module + ": the name is reserved");
    auto chunks = artifact.chunks();
    if (!chunks) return chunks.takeError();

    auto name = artifact.find(chunk_ids::Module);
    if (!name || *name != module)
        return make_error(codes::LoadError,
            "cannot load module " + module + ": artifact is for " + (name ? *name : std::string("an unnamed module")));
    auto code = artifact.find(chunk_ids::Code);
    if (!code) return make_error(codes::LoadError, "cannot load module " + module + ": no Code chunk");

    llvm::LLVMContext ctx;
    auto buf = llvm::MemoryBuffer::getMemBuffer(llvm::StringRef(*code), module, false);
    auto parsed = llvm::parseBitcodeFile(buf->getMemBufferRef(), ctx);
    if (!parsed)
        return make_error(codes::LoadError,
            "cannot load module " + module + ": " + llvm::toString(parsed.takeError()));

    code_server_.insert(module, artifact, origin_);
    if (debug_enabled()) std::fprintf(stderr, "[dbg][loader] loaded %s (%zu bytes)\n", module.c_str(), artifact.size());
    return llvm::Error::success();
}

} // namespace kiln::eval
