#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "kiln/compiler.hpp"
#include "kiln/diagnostics_json.hpp"
#include "kiln/eval/basic_dispatcher.hpp"
#include "kiln/eval/basic_evaluator.hpp"
#include "kiln/eval/memory_loader.hpp"
#include "kiln/reader.hpp"

using namespace kiln;

static std::string read_file(const std::string& path){ std::ifstream ifs(path, std::ios::binary); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static void print_diagnostic(const char* label, const Diagnostic& d){
    std::cerr << label; if(!d.code.empty()) std::cerr << "[" << d.code << "]"; std::cerr << ": " << d.message;
    if(d.line>=0) std::cerr << " (" << d.file << ":" << d.line << ")"; std::cerr << "\n";
    if(!d.hint.empty()) std::cerr << "  hint: " << d.hint << "\n";
    for(auto& n : d.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line " << n.line << ")"; std::cerr << "\n"; }
    for(auto& f : d.stack) std::cerr << "    at " << format(f) << "\n";
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: kilnc <file.kiln> [output-dir]\n"; return 1; }
    std::string file = argv[1];
    std::string out_dir = argc>2 ? argv[2] : std::string(".");
    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }

    std::vector<node_ptr> forms;
    try { forms = read_all(src, file); }
    catch(const parse_error& e){ std::cerr << "parse error: " << e.what() << "\n"; return 1; }

    eval::BasicDispatcher dispatcher;
    eval::BasicEvaluator evaluator(dispatcher);
    eval::MemoryLoader loader(CodeServer::global(), file);
    Compiler compiler(evaluator, dispatcher, loader);
    compiler.sink().on_report([](const Diagnostic& w){ print_diagnostic("warning", w); });

    Bindings bindings;
    Env env = compiler.root_env(file);
    for(auto& form : forms){
        auto r = evaluator.evaluate(form, bindings, env);
        if(!r){
            Diagnostic d = to_diagnostic(r.takeError());
            print_diagnostic("error", d);
            maybe_print_json(false, {d}, compiler.sink().warnings());
            return 2;
        }
        bindings = std::move(r->bindings);
    }

    auto binaries = compiler.binaries();
    for(auto& [name, artifact] : binaries){
        std::string path = out_dir + "/" + name + ".kiln";
        std::ofstream ofs(path, std::ios::binary);
        if(!ofs){ std::cerr << "cannot write " << path << "\n"; return 3; }
        ofs.write(artifact.bytes().data(), static_cast<std::streamsize>(artifact.size()));
    }
    maybe_print_json(true, {}, compiler.sink().warnings());
    std::cout << "compiled " << binaries.size() << " module(s)\n";
    return 0;
}
