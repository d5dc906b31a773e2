#pragma once

#include <istream>
#include <ostream>

namespace delf::cli
{

struct AppEnvironment
{
    std::istream &in;
    std::ostream &out;
    std::ostream &err;
    bool elevated = false;
};

// Effective uid 0.
bool processIsElevated();

// Full command-line run. Returns the process exit code.
int run(int argc, const char *const *argv, const AppEnvironment &environment);

} // namespace delf::cli
