#include <cassert>
#include <iostream>
#include <string>

#include "kiln/attributes.hpp"
#include "kiln/definitions.hpp"
#include "kiln/diagnostics.hpp"

using namespace kiln;

static std::string code_of(llvm::Error err){
    if (!err) return {};
    return to_diagnostic(std::move(err)).code;
}

static void test_single_value_keys(){
    AttributeStore s;
    assert(!s.read("vsn"));
    assert(code_of(s.write("vsn", n_i64(1))).empty());
    assert(code_of(s.write("vsn", n_i64(2))).empty());
    assert(to_string(*s.read("vsn")) == "2");
    assert(s.policy("vsn").persist && !s.policy("vsn").accumulate);
    s.erase("vsn");
    assert(!s.contains("vsn"));
}

static void test_accumulating_keys(){
    AttributeStore s;
    assert(code_of(s.declare_key("tags", true, false)).empty());
    auto empty = s.read("tags");
    assert(empty && elements(**empty).empty());
    assert(code_of(s.write("tags", n_kw("a"))).empty());
    assert(code_of(s.write("tags", n_kw("b"))).empty());
    // read() is newest first, values() keeps write order
    assert(to_string(*s.read("tags")) == "(:b :a)");
    assert(s.values("tags").size() == 2 && name_of(s.values("tags")[0]) == "a");
}

static void test_policy_changes(){
    AttributeStore s;
    assert(code_of(s.write("flag", n_bool(true))).empty());
    assert(code_of(s.declare_key("flag", true, false)) == codes::InvalidAttribute);
    // changing only persistence is fine
    assert(code_of(s.declare_key("flag", false, true)).empty());
    assert(s.policy("flag").persist);
    assert(code_of(s.write(AttributeStore::AccumulateKey, n_nil())) == codes::InvalidAttribute);
    assert(code_of(s.declare_key(AttributeStore::PersistKey, false, false)) == codes::InvalidAttribute);
}

static void test_user_keys_skip_internal(){
    AttributeStore s;
    assert(code_of(s.write("b", n_i64(1))).empty());
    assert(code_of(s.write("a", n_i64(2))).empty());
    std::string seen;
    for (auto e : s.user_keys()) seen += e.key + ",";
    assert(seen == "a,b,");
    // restartable
    std::string again;
    for (auto e : s.user_keys()) again += e.key + ",";
    assert(again == seen);
}

static void test_definitions_table(){
    DefinitionsTable t;
    bool is_new = false;
    assert(code_of(t.define(DefKind::Def, {"f", 1}, node_list(), 1, &is_new)).empty() && is_new);
    assert(code_of(t.define(DefKind::Def, {"f", 1}, node_list(), 2, &is_new)).empty() && !is_new);
    assert(t.find({"f", 1})->clauses.size() == 2);
    assert(code_of(t.define(DefKind::Defmacro, {"m", 0}, node_list(), 3)).empty());
    assert(code_of(t.define(DefKind::Defp, {"p", 2}, node_list(), 4)).empty());
    assert(code_of(t.define(DefKind::Defp, {"f", 1}, node_list(), 5)) == codes::DefinitionKindMismatch);

    auto u = t.unwrap();
    assert(u.def.size() == 1 && u.defp.size() == 1 && u.defmacro.size() == 1);
    assert(u.exports.size() == 2);
    assert(u.exports[0].str() == "MACRO-m/1");
    assert(u.exports[1].str() == "f/1");
    assert(u.all.size() == 3);

    t.freeze();
    assert(code_of(t.define(DefKind::Def, {"g", 0}, node_list(), 6)) == codes::InvalidPhase);
}

void run_attribute_store_tests(){
    std::cout << "[attributes] tests...\n";
    test_single_value_keys();
    test_accumulating_keys();
    test_policy_changes();
    test_user_keys_skip_internal();
    test_definitions_table();
    std::cout << "[attributes] tests passed\n";
}
