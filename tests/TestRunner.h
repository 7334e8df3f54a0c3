#pragma once

// Minimal runner shared by the test executables: each test is a function that
// throws on failure, and the process exit code reports the overall result.

#include "V9Kdisk.h"

struct TestCase
{
    const char* name;
    std::function<void()> fn;
};

#define CHECK(cond) \
    do { if (!(cond)) throw util::exception(__FILE__, ':', __LINE__, ": check failed: ", #cond); } while (0)

#define CHECK_EQUAL(a, b) \
    do { auto a_ = (a); auto b_ = (b); if (!(a_ == b_)) \
        throw util::exception(__FILE__, ':', __LINE__, ": ", #a, " is ", a_, ", expected ", b_); } while (0)

#define CHECK_THROWS(expr, type) \
    do { bool thrown_ = false; try { expr; } catch (const type&) { thrown_ = true; } \
        if (!thrown_) throw util::exception(__FILE__, ':', __LINE__, ": ", #expr, " didn't throw ", #type); } while (0)

// Catch a specific error so its fields can be checked
template <typename E, typename Fn>
E ExpectError(Fn fn, const char* expr)
{
    try
    {
        fn();
    }
    catch (const E& e)
    {
        return e;
    }

    throw util::exception(expr, " didn't throw the expected error");
}

#define EXPECT_ERROR(type, expr) ExpectError<type>([&]() { expr; }, #expr)

inline int RunTests(const std::vector<TestCase>& tests)
{
    int failed = 0;

    for (auto& test : tests)
    {
        try
        {
            test.fn();
            util::cout << "RESULT: [PASSED] " << test.name << '\n';
        }
        catch (const std::exception& e)
        {
            util::cout << colour::RED << "RESULT: [FAILED] " << test.name << ": " << e.what() << colour::none << '\n';
            ++failed;
        }
    }

    util::cout << "------------------------------------------------\n";
    if (!failed)
    {
        util::cout << "ALL TESTS PASSED\n";
        return 0;
    }

    util::cout << failed << " TEST(S) FAILED\n";
    return 1;
}
