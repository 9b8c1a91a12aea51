//
// Tests for the preemption timer used to bound program execution
//

#include <catch2/catch_test_macros.hpp>
#include "sandbox/preemption_timer.h"
#include <chrono>
#include <thread>

using nlytics::sandbox::PreemptionTimer;
using namespace std::chrono_literals;

TEST_CASE("PreemptionTimer fires after its timeout", "[sandbox][timer]")
{
    PreemptionTimer timer{20ms};
    REQUIRE_FALSE(timer.Fired());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!timer.Token().load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(timer.Fired());
}

TEST_CASE("PreemptionTimer disarmed before timeout never fires", "[sandbox][timer]")
{
    PreemptionTimer timer{200ms};
    timer.Disarm();
    std::this_thread::sleep_for(300ms);
    REQUIRE_FALSE(timer.Fired());

    SECTION("disarming twice is harmless") {
        REQUIRE_NOTHROW(timer.Disarm());
    }
}

TEST_CASE("PreemptionTimer destructor does not wait for the timeout", "[sandbox][timer]")
{
    const auto start = std::chrono::steady_clock::now();
    {
        PreemptionTimer timer{10s};
    }
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
}
