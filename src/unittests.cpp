#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Many cases feed broken schemas on purpose, so only let through what would abort a run.
    spdlog::set_level(spdlog::level::critical);

    doctest::Context context;
    context.setOption("order-by", "file");
    context.applyCommandLine(argc, argv);
    return context.run();
}
