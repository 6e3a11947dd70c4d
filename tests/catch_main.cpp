#include <catch2/catch_session.hpp>

#include <canif/canif.hpp>

#include <iostream>
#include <sstream>
#include <string>

inline std::string test_environment() {
    std::ostringstream ss;

#if defined(_MSC_VER)
    ss << "Compiler: MSVC " << _MSC_VER << "\n";
#elif defined(__clang__)
    ss << "Compiler: Clang " << __clang_major__ << "." << __clang_minor__ << "\n";
#elif defined(__GNUC__)
    ss << "Compiler: GCC " << __GNUC__ << "." << __GNUC_MINOR__ << "\n";
#endif

#if defined(NDEBUG)
    ss << "Build: release\n";
#else
    ss << "Build: debug\n";
#endif

#ifdef _WIN32
    ss << "OS: Windows\n";
#elif defined(__linux__)
    ss << "OS: Linux\n";
#endif

    ss << "canif max depth: " << canif::kDefaultMaxDepth << "\n";
    return ss.str();
}

int main(int argc, char* argv[]) {
    std::cout << test_environment() << "\n";
    return Catch::Session().run(argc, argv);
}
