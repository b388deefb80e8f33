#include "report/session.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace parsediag;

TEST(SessionScopeTest, InstallsAndRestores) {
    EXPECT_EQ(current_session(), nullptr);
    WarningCollector collector;
    {
        SessionScope scope(collector);
        EXPECT_EQ(current_session(), &collector);
    }
    EXPECT_EQ(current_session(), nullptr);
}

TEST(SessionScopeTest, Nesting) {
    WarningCollector outer;
    WarningCollector inner;
    SessionScope a(outer);
    {
        SessionScope b(inner);
        EXPECT_EQ(current_session(), &inner);
    }
    EXPECT_EQ(current_session(), &outer);
}

TEST(SessionScopeTest, PerThread) {
    WarningCollector collector;
    SessionScope scope(collector);

    CompilationSession* seen = &collector;
    std::thread t([&] { seen = current_session(); });
    t.join();

    EXPECT_EQ(seen, nullptr);
    EXPECT_EQ(current_session(), &collector);
}

TEST(WarningCollectorTest, CountsAndClears) {
    WarningCollector collector;
    collector.post_warning(WarningEvent{"a.ex", 1, "x"});
    collector.register_warning();
    collector.register_warning();
    EXPECT_EQ(collector.events().size(), 1u);
    EXPECT_EQ(collector.warning_count(), 2u);

    collector.clear();
    EXPECT_TRUE(collector.events().empty());
    EXPECT_EQ(collector.warning_count(), 0u);
}

TEST(WarningCollectorTest, HandlerMayQueryCollector) {
    WarningCollector collector;
    size_t seen_size = 0;
    collector.set_handler([&](const WarningEvent&) { seen_size = collector.events().size(); });
    collector.post_warning(WarningEvent{"a.ex", 1, "x"});
    EXPECT_EQ(seen_size, 1u);
}

TEST(WarningCollectorTest, ConcurrentReporters) {
    WarningCollector collector;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&collector] {
            SessionScope scope(collector);
            for (int j = 0; j < kPerThread; ++j) {
                current_session()->post_warning(WarningEvent{"a.ex", static_cast<uint32_t>(j), "x"});
                current_session()->register_warning();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(collector.events().size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(collector.warning_count(), static_cast<uint32_t>(kThreads * kPerThread));
}
