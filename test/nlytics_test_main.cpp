//
// NLytics Test Runner
//
// Arrow compute kernels must be registered before any frame operation runs.
//

#include <catch2/catch_session.hpp>
#include <arrow/compute/initialize.h>
#include <spdlog/spdlog.h>
#include <iostream>

int main(int argc, char* argv[])
{
    auto arrowComputeStatus = arrow::compute::Initialize();
    if (!arrowComputeStatus.ok())
    {
        std::cerr << "arrow compute initialized failed: " << arrowComputeStatus.ToString() << "\n";
        return 1;
    }
    spdlog::set_level(spdlog::level::warn);

    return Catch::Session().run(argc, argv);
}
