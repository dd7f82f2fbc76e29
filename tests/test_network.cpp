#include <gtest/gtest.h>

#include <chrono>

#include "error_manager.hpp"
#include "network/wait_for_network.hpp"

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST(WaitForNetwork, UnreachableHostTimesOut) {
    // Nothing listens on port 1, so every probe is refused.
    const std::string host = "http://127.0.0.1:1/";

    auto start = Clock::now();
    try {
        Network::waitForNetwork(host, 1s);
        FAIL() << "expected OikosError";
    } catch (const OikosError& e) {
        EXPECT_EQ(e.code(), "ERR_NETWORK_TIMEOUT");
        EXPECT_NE(std::string(e.what()).find(host), std::string::npos);
    }
    EXPECT_GE(Clock::now() - start, 1s);
    EXPECT_LT(Clock::now() - start, 10s);
}
