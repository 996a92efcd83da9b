#include <iostream>
#include <exception>
// GoogleTest suites are compiled into this binary too (linked against GTest::gtest,
// not gtest_main), so the assert-based harness runs first and then RUN_ALL_TESTS.
#include <gtest/gtest.h>

void run_reader_tests();
void run_attribute_store_tests();
void run_artifact_container_tests();
void run_diagnostics_json_tests();
void run_options_tests();

int main(int argc, char** argv){
    try{
        run_reader_tests();
        run_attribute_store_tests();
        // Container layout and chunk lookup
        run_artifact_container_tests();
        run_diagnostics_json_tests();
        run_options_tests();
    }catch(const std::exception& e){ std::cerr << "[kiln_tests] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
