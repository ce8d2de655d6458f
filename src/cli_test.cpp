// =============================================================================
// src/cli_test.cpp - Command-Line Parsing Tests
// =============================================================================

#include <limits>

#include "runtime/CommandLine.hpp"
#include "testing/TestSuite.hpp"

using namespace tribunal;

class CliTest : public testing::TestSuite {
public:
    CliTest() : TestSuite("COMMAND LINE - UNIT TESTS") {}

    void run_all_tests() {
        print_banner();

        test_args();
        test_integers();
        test_duration_range();

        print_summary();
    }

private:
    static constexpr long long INT_MAX_LL = std::numeric_limits<int>::max();

    void test_args() {
        std::cout << "Testing Argument Split...\n";

        Args a = parseArgs({"evt-1", "--operator", "officer", "--reason", "appeal", "extra"});
        CHECK(a.positional == (std::vector<std::string>{"evt-1", "extra"}), "positionals kept in order");
        CHECK(a.require("operator") == "officer" && a.opt("reason") == "appeal", "options by name");
        CHECK(!a.has("duration") && a.opt("duration", "none") == "none", "absent option default");
        CHECK_THROWS(a.require("decision"), UsageError, "missing required option");
        CHECK_THROWS(a.arg(2, "event_id"), UsageError, "missing positional");
        CHECK_THROWS(parseArgs({"--limit"}), UsageError, "option without value");
        std::cout << "\n";
    }

    void test_integers() {
        std::cout << "Testing Integer Parsing...\n";

        CHECK(parseInteger("42", "--limit", 0, 100) == 42, "plain integer");
        CHECK_THROWS(parseInteger("42x", "--limit", 0, 100), UsageError, "trailing junk");
        CHECK_THROWS(parseInteger("", "--limit", 0, 100), UsageError, "empty");
        CHECK_THROWS(parseInteger("-1", "--offset", 0, 100), UsageError, "below range");
        CHECK_THROWS(parseInteger("99999999999999999999", "--limit", 0, 100), UsageError,
                     "beyond long long");
        std::cout << "\n";
    }

    void test_duration_range() {
        std::cout << "Testing Override Duration Range...\n";

        CHECK(parseInteger("30", "--duration", 0, INT_MAX_LL) == 30, "ordinary duration");
        CHECK(parseInteger("2147483647", "--duration", 0, INT_MAX_LL) == INT_MAX_LL, "largest int accepted");
        CHECK_THROWS(parseInteger("4294967326", "--duration", 0, INT_MAX_LL), UsageError,
                     "value that would wrap to 30 is rejected");
        CHECK_THROWS(parseInteger("2147483648", "--duration", 0, INT_MAX_LL), UsageError, "int max + 1 rejected");
        CHECK_THROWS(parseInteger("-5", "--duration", 0, INT_MAX_LL), UsageError, "negative rejected");
        std::cout << "\n";
    }
};

int main() {
    CliTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
