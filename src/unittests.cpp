// Runs every doctest case linked into the unittests binary.
#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Expected failures in the tests report through spdlog, keep trace output out of the test log.
    spdlog::set_level(spdlog::level::debug);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
