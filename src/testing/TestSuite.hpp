// =============================================================================
// TestSuite.hpp - shared scaffolding for the standalone *_test executables
// =============================================================================
// Each test binary derives from TestSuite, calls its test_* methods from
// run_all_tests(), and returns exit_code() from main(). CTest reads the exit
// code; the console output is for humans.
// =============================================================================
#pragma once

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tribunal {
namespace testing {

class TestSuite {
public:
    explicit TestSuite(std::string title) : title_(std::move(title)) {}
    virtual ~TestSuite() = default;

    void print_banner() const {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║  " << std::left << std::setw(64) << title_ << "║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";
    }

    void print_summary() const {
        std::cout << "\n  Passed: " << tests_passed_ << "\n";
        std::cout << "  Failed: " << tests_failed_ << "\n";
        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }

    int exit_code() const { return tests_failed_ == 0 ? 0 : 1; }

protected:
    void test_pass(const std::string& name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const std::string& name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const std::string& name, const char* expr) {
        if (ok) test_pass(name);
        else    test_fail(name, std::string("expected: ") + expr);
    }

private:
    std::string title_;
    int tests_passed_ = 0;
    int tests_failed_ = 0;
};

} // namespace testing
} // namespace tribunal

// CHECK(condition, "what it shows")
#define CHECK(cond, name) check(static_cast<bool>(cond), (name), #cond)

// CHECK_THROWS(expr, ExceptionType, "what it shows")
#define CHECK_THROWS(expr, Ex, name)                                        \
    do {                                                                    \
        bool caught_ = false;                                               \
        try { (void)(expr); }                                               \
        catch (const Ex&) { caught_ = true; }                               \
        catch (const std::exception&) {}                                    \
        check(caught_, (name), #expr " throws " #Ex);                       \
    } while (0)
