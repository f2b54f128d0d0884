#pragma once

#include <exception>
#include <string>

/**
 * Infrastructure failure inside a single test case: a process could not be
 * spawned, a fixture or FIFO could not be created, a write to a child's
 * input failed. Thrown by the runner, the FIFO feed and the fixture setup;
 * caught by the case executor, which fails the current case and moves on.
 */
class HarnessException: public std::exception {
    private:
        std::string _msg;
    public:
        HarnessException(const std::string& msg) : _msg(msg){}

        virtual const char* what() const noexcept override
        {
            return _msg.c_str();
        }
};
