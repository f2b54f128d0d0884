#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

/* thrown by 'expect' when a check inside a test does not hold */
class TestFailure: public std::exception {
    private:
        std::string _msg;
    public:
        TestFailure(const std::string& msg) : _msg(msg){}

        virtual const char* what() const noexcept override
        {
            return _msg.c_str();
        }
};

inline void expect(bool condition, const std::string& what)
{
    if (!condition) throw TestFailure(what);
}

inline void expect_equal(const std::string& actual, const std::string& expected,
                         const std::string& what)
{
    if (actual != expected) {
        throw TestFailure(what + "\ngot: \n" + actual + "\nexpected: \n" + expected);
    }
}

class UnitTestHarness {
  public:
    void add_test(std::string name, std::function<void()> body) {
        _test_cases.push_back(TestEntry{name, body});
    }

    /* @return the number of failed tests */
    int run_all_tests() {
        int n_correct = 0;
        for (auto &[name, body]: _test_cases) {
            bool failed = false;
            std::string failure;
            try {
                body();
            }
            catch (std::exception& e) {
                failed = true;
                failure = e.what();
            }
            if (failed) {
                std::cout << "Test FAILED: " << name << std::endl <<
                failure << std::endl;
            }
            else {
                std::cout << "Test PASSED: " << name << std::endl;
                ++n_correct;
            }
        }
        std::cout << std::endl << std::endl << "TOTAL: " << n_correct << " / " <<
        _test_cases.size() << " tests passed." << std::endl;
        return static_cast<int>(_test_cases.size()) - n_correct;
    }

  private:
    struct TestEntry {
        std::string name;
        std::function<void()> body;
    };
    std::vector<TestEntry> _test_cases;
};
