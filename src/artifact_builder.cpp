#include "kiln/artifact_builder.hpp"
#include "kiln/code_server.hpp"
#include "kiln/options.hpp"

#include <llvm/Bitcode/BitcodeWriter.h>
#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/raw_ostream.h>

namespace kiln {

bool BuildOptions::has_flag(const std::string& name) const {
    for (auto& f : flags)
        if (f && (is_keyword(*f) || is_symbol(*f)) && name_of(f) == name) return true;
    return false;
}

std::string stub_symbol(const Definition& def) {
    return (is_macro(def.kind) ? macro_dispatch(def.id) : def.id).str();
}

namespace {

llvm::GlobalVariable* string_global(llvm::Module& M, const std::string& name, const std::string& text,
                                    llvm::GlobalValue::LinkageTypes linkage) {
    auto* init = llvm::ConstantDataArray::getString(M.getContext(), text, true);
    return new llvm::GlobalVariable(M, init->getType(), true, linkage, init, name);
}

std::string clauses_text(const Definition& def) {
    auto v = node_vec();
    for (auto& c : def.clauses) v << c;
    return to_string(v);
}

void optimize(llvm::Module& M) {
    llvm::PassBuilder PB;
    llvm::LoopAnalysisManager LAM;
    llvm::FunctionAnalysisManager FAM;
    llvm::CGSCCAnalysisManager CGAM;
    llvm::ModuleAnalysisManager MAM;
    PB.registerModuleAnalyses(MAM);
    PB.registerCGSCCAnalyses(CGAM);
    PB.registerFunctionAnalyses(FAM);
    PB.registerLoopAnalyses(LAM);
    PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);
    llvm::ModulePassManager MPM = PB.buildPerModuleDefaultPipeline(llvm::OptimizationLevel::O2);
    MPM.run(M, MAM);
}

} // namespace

std::unique_ptr<llvm::Module> ArtifactBuilder::emit_module(const ModuleSections& s, const BuildOptions& opts,
                                                           llvm::LLVMContext& ctx) const {
    auto M = std::make_unique<llvm::Module>(s.module, ctx);
    M->setSourceFileName(s.location.file);
    if (!opts.target_triple.empty()) M->setTargetTriple(opts.target_triple);

    auto* i8p = llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(ctx));
    auto* i8pp = llvm::PointerType::getUnqual(i8p);
    auto* i32 = llvm::Type::getInt32Ty(ctx);
    auto* dispatchTy = llvm::FunctionType::get(i8p, {i8p, i8p, i32, i8pp}, false);
    llvm::FunctionCallee rt = M->getOrInsertFunction(RuntimeDispatchSymbol, dispatchTy);
    llvm::Constant* module_name = llvm::ConstantExpr::getPointerCast(
        string_global(*M, ".kiln.module", s.module, llvm::GlobalValue::PrivateLinkage), i8p);

    for (auto& def : s.definitions) {
        const std::string sym = stub_symbol(def);
        const unsigned arity = static_cast<unsigned>(is_macro(def.kind) ? def.id.arity + 1 : def.id.arity);
        std::vector<llvm::Type*> params(arity, i8p);
        auto* fty = llvm::FunctionType::get(i8p, params, false);
        auto linkage = is_public(def.kind) ? llvm::Function::ExternalLinkage : llvm::Function::InternalLinkage;
        auto* F = llvm::Function::Create(fty, linkage, sym, *M);
        auto* clauses = string_global(*M, ".kiln.clauses." + sym, clauses_text(def), llvm::GlobalValue::PrivateLinkage);

        llvm::IRBuilder<> b(llvm::BasicBlock::Create(ctx, "entry", F));
        llvm::Value* argv = llvm::ConstantPointerNull::get(i8pp);
        if (arity > 0) {
            auto* arrTy = llvm::ArrayType::get(i8p, arity);
            auto* slots = b.CreateAlloca(arrTy, nullptr, "argv");
            unsigned i = 0;
            for (auto& arg : F->args()) {
                arg.setName("a" + std::to_string(i));
                b.CreateStore(&arg, b.CreateConstInBoundsGEP2_32(arrTy, slots, 0, i));
                ++i;
            }
            argv = b.CreateConstInBoundsGEP2_32(arrTy, slots, 0, 0);
        }
        auto* result = b.CreateCall(rt, {module_name, llvm::ConstantExpr::getPointerCast(clauses, i8p),
                                         b.getInt32(arity), argv});
        b.CreateRet(result);
    }

    // __info__/1: switch over the kind index, each case returns a constant string.
    auto* infoTy = llvm::FunctionType::get(i8p, {i32}, false);
    auto* info = llvm::Function::Create(infoTy, llvm::Function::ExternalLinkage, info_function().str(), *M);
    auto* entry = llvm::BasicBlock::Create(ctx, "entry", info);
    auto* unknown = llvm::BasicBlock::Create(ctx, "unknown", info);
    llvm::IRBuilder<>(unknown).CreateRet(llvm::ConstantPointerNull::get(i8p));
    llvm::IRBuilder<> b(entry);
    auto* sw = b.CreateSwitch(info->getArg(0), unknown, InfoKindCount);
    for (uint32_t k = 0; k < InfoKindCount; ++k) {
        auto kind = static_cast<InfoKind>(k);
        auto* gv = string_global(*M, std::string("__info__.") + info_kind_name(kind), info_answer(s, kind),
                                 llvm::GlobalValue::ExternalLinkage);
        auto* bb = llvm::BasicBlock::Create(ctx, info_kind_name(kind), info);
        llvm::IRBuilder<>(bb).CreateRet(llvm::ConstantExpr::getPointerCast(gv, i8p));
        sw->addCase(b.getInt32(k), bb);
    }
    return M;
}

llvm::Expected<std::string> ArtifactBuilder::emit_code(const ModuleSections& s, const BuildOptions& opts) const {
    llvm::LLVMContext ctx;
    auto M = emit_module(s, opts, ctx);
    if (!opts.has_flag("no-verify")) {
        std::string msg;
        llvm::raw_string_ostream os(msg);
        if (llvm::verifyModule(*M, &os)) {
            os.flush();
            return make_error(codes::BuildError, "generated code for " + s.module + " failed verification: " + msg,
                              s.location.file, s.location.line);
        }
    }
    if (opts.has_flag("optimize")) optimize(*M);
    std::string bitcode;
    llvm::raw_string_ostream os(bitcode);
    llvm::WriteBitcodeToFile(*M, os);
    os.flush();
    if (debug_enabled()) std::fprintf(stderr, "[dbg][build] %s: %zu bytes of bitcode\n", s.module.c_str(), bitcode.size());
    return bitcode;
}

llvm::Expected<Artifact> ArtifactBuilder::build(const ModuleSections& s, const BuildOptions& opts,
                                                const BuiltCallback& on_built) const {
    auto code = emit_code(s, opts);
    if (!code) return code.takeError();

    auto types = node_vec();
    auto export_types = node_vec();
    for (auto& t : s.types) {
        types << to_form(t);
        if (t.exported()) export_types << node_vec({n_sym(t.id.name), n_i64(t.id.arity)});
    }
    auto specs = node_vec();
    for (auto& d : s.specs) specs << to_form(d);
    auto optional = node_vec();
    for (auto& id : s.optional_callbacks) optional << node_vec({n_sym(id.name), n_i64(id.arity)});

    std::vector<Chunk> chunks = {
        {chunk_ids::Location, to_string(node_vec({n_str(s.location.file), n_i64(s.location.line)}))},
        {chunk_ids::Module, s.module},
        {chunk_ids::Exports, encode_exports(s.exports)},
        {chunk_ids::Code, std::move(*code)},
        {chunk_ids::Types, to_string(node_map({kvp(n_kw("types"), types), kvp(n_kw("export-types"), export_types)}))},
        {chunk_ids::Specs, to_string(node_map({kvp(n_kw("specs"), specs), kvp(n_kw("optional-callbacks"), optional)}))},
        {chunk_ids::Attributes, info_answer(s, InfoKind::Attributes)},
        {chunk_ids::CompileInfo, to_string(node_map({kvp(n_kw("options"), node_vec(s.compile_opts)),
                                                     kvp(n_kw("source"), n_str(s.location.file))}))},
    };
    auto artifact = Artifact::from_chunks(chunks);
    if (!artifact) return artifact.takeError();

    Artifact out = std::move(*artifact);
    if (s.docs) {
        auto with_docs = out.with_chunk(chunk_ids::Docs, to_string(s.docs));
        if (!with_docs) return with_docs.takeError();
        out = std::move(*with_docs);
    }
    if (on_built)
        if (auto err = on_built(out)) return std::move(err);
    return out;
}

} // namespace kiln
