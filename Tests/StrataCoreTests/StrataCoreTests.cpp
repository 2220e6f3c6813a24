// Tests rely on assert() whatever the build type
#undef NDEBUG

#include <StrataCore.hpp>
#include <cassert>
#include <iostream>

#include "TestModels.hpp"
#include "ConverterTests.hpp"
#include "SchemaTests.hpp"
#include "DatabaseTests.hpp"
#include "ObjectTests.hpp"
#include "CascadeTests.hpp"
#include "QueryTests.hpp"
#include "ConfigTests.hpp"

int main() {
    std::cout << "=== StrataCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        register_test_converters();

        converter_tests::run_all();
        schema_tests::run_all();
        database_tests::run_all();
        object_tests::run_all();
        cascade_tests::run_all();
        query_tests::run_all();
        config_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (7 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
