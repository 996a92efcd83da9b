#include <cassert>
#include <cstdlib>
#include <initializer_list>
#include <iostream>

#include "kiln/options.hpp"

using namespace kiln;

// Set a variable, or unset it when value is null.
static void set_var(const char* name, const char* value){
    int rc = value ? ::setenv(name, value, 1) : ::unsetenv(name);
    assert(rc == 0);
    (void)rc;
}

static void clear_option_vars(){
    for (const char* name : {"KILN_DOCS", "KILN_IGNORE_MODULE_CONFLICT", "KILN_INTERNAL", "KILN_TARGET_TRIPLE", "KILN_DIAG_JSON"})
        set_var(name, nullptr);
}

static void test_defaults(){
    clear_option_vars();
    auto o = detect_options();
    assert(o.docs);
    assert(!o.ignore_module_conflict);
    assert(!o.internal);
    assert(o.target_triple.empty());
}

static void test_env_overrides(){
    set_var("KILN_DOCS", "0");
    set_var("KILN_IGNORE_MODULE_CONFLICT", "1");
    set_var("KILN_INTERNAL", "yes");
    set_var("KILN_TARGET_TRIPLE", "aarch64-unknown-linux-gnu");
    set_var("KILN_DIAG_JSON", "t");
    auto o = detect_options();
    assert(!o.docs);
    assert(o.ignore_module_conflict);
    assert(o.internal);
    assert(o.target_triple == "aarch64-unknown-linux-gnu");
    assert(o.diag_json);
    clear_option_vars();
}

static void test_flag_spellings(){
    set_var("KILN_TEST_FLAG", "T");
    assert(env_flag_enabled("KILN_TEST_FLAG"));
    set_var("KILN_TEST_FLAG", "0");
    assert(!env_flag_enabled("KILN_TEST_FLAG"));
    set_var("KILN_TEST_FLAG", "");
    assert(!env_flag_enabled("KILN_TEST_FLAG"));
    set_var("KILN_TEST_FLAG", nullptr);
    assert(!env_flag_enabled("KILN_TEST_FLAG"));
}

void run_options_tests(){
    std::cout << "[options] tests...\n";
    test_defaults();
    test_env_overrides();
    test_flag_spellings();
    std::cout << "[options] tests passed\n";
}
