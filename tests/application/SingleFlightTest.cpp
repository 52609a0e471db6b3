#include <gtest/gtest.h>

#include "application/SingleFlight.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tiercache::application;

class SingleFlightTest : public ::testing::Test {
protected:
    SingleFlight group_;
};

TEST_F(SingleFlightTest, Run_SingleCaller_ReturnsResult) {
    auto result = group_.run("k", [] { return SingleFlight::Result{"bytes", true}; });

    EXPECT_EQ(result.bytes, "bytes");
    EXPECT_TRUE(result.cached);
    EXPECT_EQ(group_.inFlight(), 0u);
}

TEST_F(SingleFlightTest, Run_ConcurrentSameKey_ExecutesOnce) {
    const int N = 16;
    std::atomic<int> calls{0};
    std::atomic<bool> release{false};
    std::vector<SingleFlight::Result> results(N);
    std::vector<std::thread> threads;

    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i]() {
            results[i] = group_.run("shared", [&]() {
                ++calls;
                while (!release) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                return SingleFlight::Result{"value", false};
            });
        });
    }

    // Ждём, пока все присоединятся к группе лидера
    for (int i = 0; i < 2000 && group_.joined("shared") < static_cast<size_t>(N); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(group_.joined("shared"), static_cast<size_t>(N));
    release = true;

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(calls, 1);
    for (const auto& r : results) {
        EXPECT_EQ(r.bytes, "value");
        EXPECT_FALSE(r.cached);
    }
    EXPECT_EQ(group_.inFlight(), 0u);
}

TEST_F(SingleFlightTest, Run_Exception_PropagatesToAllWaiters) {
    const int N = 8;
    std::atomic<int> calls{0};
    std::atomic<int> failures{0};
    std::atomic<bool> release{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&]() {
            try {
                group_.run("bad", [&]() -> SingleFlight::Result {
                    ++calls;
                    while (!release) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    }
                    throw std::runtime_error("producer failed");
                });
            } catch (const std::runtime_error& e) {
                if (std::string(e.what()) == "producer failed") {
                    ++failures;
                }
            }
        });
    }

    for (int i = 0; i < 2000 && group_.joined("bad") < static_cast<size_t>(N); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release = true;

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(failures, N);
    EXPECT_EQ(group_.inFlight(), 0u);
}

TEST_F(SingleFlightTest, Run_AfterCompletion_ExecutesAgain) {
    int calls = 0;
    auto fn = [&] { ++calls; return SingleFlight::Result{"v", false}; };

    group_.run("k", fn);
    group_.run("k", fn);

    EXPECT_EQ(calls, 2);
}

TEST_F(SingleFlightTest, Run_DifferentKeys_DoNotBlockEachOther) {
    std::atomic<bool> slowStarted{false};
    std::atomic<bool> releaseSlow{false};

    std::thread slow([&]() {
        group_.run("slow", [&]() {
            slowStarted = true;
            while (!releaseSlow) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return SingleFlight::Result{"slow", false};
        });
    });

    while (!slowStarted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // Пока "slow" выполняется, другой ключ завершается сразу
    auto fast = group_.run("fast", [] { return SingleFlight::Result{"fast", false}; });
    EXPECT_EQ(fast.bytes, "fast");
    EXPECT_EQ(group_.inFlight(), 1u);

    releaseSlow = true;
    slow.join();
    EXPECT_EQ(group_.inFlight(), 0u);
}

TEST_F(SingleFlightTest, Joined_CountsOnlyCurrentGroup) {
    EXPECT_EQ(group_.joined("k"), 0u);

    // Первая группа завершена, её участники не учитываются
    group_.run("k", [] { return SingleFlight::Result{"v", false}; });

    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::thread leader([&]() {
        group_.run("k", [&]() {
            started = true;
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return SingleFlight::Result{"v", false};
        });
    });

    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(group_.joined("k"), 1u);

    release = true;
    leader.join();
    EXPECT_EQ(group_.joined("k"), 0u);
}
