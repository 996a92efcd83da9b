#include <cassert>
#include <iostream>
#include <string>

#include "kiln/artifact.hpp"
#include "kiln/code_server.hpp"
#include "kiln/diagnostics.hpp"

using namespace kiln;

static Artifact must(llvm::Expected<Artifact> a){
    if (!a) {
        std::cerr << "[artifact] " << format(to_diagnostic(a.takeError())) << "\n";
        assert(false && "artifact construction failed");
    }
    return std::move(*a);
}

static void test_container_layout(){
    Artifact a = must(Artifact::from_chunks({{"Modl", "Mod"}, {"Abcd", ""}, {"Tail", "12345"}}));
    const std::string& b = a.bytes();
    assert(b.compare(0, 4, "FOR1") == 0);
    assert(b.compare(8, 4, "KILN") == 0);
    assert(b.size() % 4 == 0);
    // header 12 + (8+4) + 8 + (8+8)
    assert(b.size() == 48);
    assert(a.find("Modl") && *a.find("Modl") == "Mod");
    assert(a.find("Abcd") && a.find("Abcd")->empty());
    assert(a.find("Tail") && *a.find("Tail") == "12345");
    assert(!a.find("None"));
}

static void test_with_chunk_is_persistent(){
    Artifact a = must(Artifact::from_chunks({{"Modl", "Mod"}}));
    Artifact b = must(a.with_chunk("Docs", "doc"));
    assert(!a.find("Docs"));
    assert(b.find("Docs") && *b.find("Docs") == "doc");
    auto chunks = b.chunks();
    assert(chunks && chunks->size() == 2 && (*chunks)[1].id == "Docs");

    auto bad = a.with_chunk("TooLong", "x");
    assert(!bad);
    assert(to_diagnostic(bad.takeError()).code == codes::BuildError);
}

static void test_from_bytes_validates(){
    Artifact a = must(Artifact::from_chunks({{"Modl", "Mod"}}));
    Artifact copy = must(Artifact::from_bytes(a.bytes()));
    assert(copy.bytes() == a.bytes());

    std::string broken = a.bytes();
    broken[0] = 'X';
    auto r1 = Artifact::from_bytes(broken);
    assert(!r1 && to_diagnostic(r1.takeError()).code == codes::LoadError);

    std::string truncated = a.bytes().substr(0, a.size() - 4);
    auto r2 = Artifact::from_bytes(truncated);
    assert(!r2 && to_diagnostic(r2.takeError()).code == codes::LoadError);

    auto r3 = Artifact::from_bytes("FOR1");
    assert(!r3);
    llvm::consumeError(r3.takeError());
}

static void test_exports_payload(){
    std::vector<NameArity> ex = {{"MACRO-m", 2}, {"__info__", 1}, {"add", 2}};
    auto round = decode_exports(encode_exports(ex));
    assert(round.size() == 3 && round[0] == ex[0] && round[2] == ex[2]);
    assert(decode_exports("").empty());
}

static void test_info_kinds(){
    assert(parse_info_kind("compile-opts") == InfoKind::CompileOpts);
    assert(parse_info_kind("native-addresses") == InfoKind::NativeAddresses);
    assert(!parse_info_kind("md5"));
    for (uint32_t i = 0; i < InfoKindCount; ++i)
        assert(parse_info_kind(info_kind_name(static_cast<InfoKind>(i))) == static_cast<InfoKind>(i));
    Artifact empty = must(Artifact::from_chunks({{"Modl", "Mod"}}));
    auto r = empty.info(InfoKind::Module);
    assert(!r && to_diagnostic(r.takeError()).code == codes::LoadError);
}

void run_artifact_container_tests(){
    std::cout << "[artifact] tests...\n";
    test_container_layout();
    test_with_chunk_is_persistent();
    test_from_bytes_validates();
    test_exports_payload();
    test_info_kinds();
    std::cout << "[artifact] tests passed\n";
}
