// tests/test_main.cpp
#include "test_framework.hpp"
#include <cstring>

// Tests are registered via static initializers in the other compilation
// units. This TU provides main(); an optional argv[1] runs only the tests
// whose name contains it.
int main(int argc, char** argv) {
    const char* filter = argc > 1 ? argv[1] : nullptr;
    std::size_t ran = 0, passed = 0;
    for (const auto& test : tfw::registry()) {
        if (filter && test.name.find(filter) == std::string::npos) continue;
        ++ran;
        std::cout << "[ RUN      ] " << test.name << std::endl;
        auto start = std::chrono::high_resolution_clock::now();
        try {
            test.fn();
            std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock::now() - start;
            std::cout << "[       OK ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
            ++passed;
        } catch (const tfw::Failure& e) {
            std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock::now() - start;
            std::cout << e.what() << std::endl;
            std::cout << "[  FAILED  ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
        } catch (const std::exception& e) {
            std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock::now() - start;
            std::cout << "[  EXCEPTION  ] " << test.name << ": " << e.what() << " (" << elapsed.count() << "s)" << std::endl;
        }
    }
    std::cout << "[==========] " << ran << " tests ran. " << passed << " passed, " << (ran - passed) << " failed." << std::endl;
    return (passed == ran) ? 0 : 1;
}
