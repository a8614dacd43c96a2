#include "rkg/graph/scan_cache.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace rkg::graph
{
    TEST(ScanCacheTest, RecordAndLookup) {
        ScanCache cache;
        EXPECT_FALSE(cache.lookup("a.ts").has_value());

        cache.record("a.ts", {120, 10});
        cache.record("b.ts", {40, 3});

        EXPECT_EQ(cache.lookup("a.ts"), (FileStats{120, 10}));
        EXPECT_EQ(cache.size(), 2u);
        EXPECT_EQ(cache.total_lines(), 13u);
        EXPECT_EQ(cache.paths(), (std::vector<std::string>{"a.ts", "b.ts"}));
    }

    TEST(ScanCacheTest, HasChanged) {
        ScanCache cache;
        cache.record("a.ts", {120, 10});

        EXPECT_FALSE(cache.has_changed("a.ts", {120, 10}));
        EXPECT_TRUE(cache.has_changed("a.ts", {121, 10}));
        EXPECT_TRUE(cache.has_changed("new.ts", {1, 1}));
    }

    TEST(ScanCacheTest, Clear) {
        ScanCache cache;
        cache.record("a.ts", {1, 1});
        cache.clear();

        EXPECT_EQ(cache.size(), 0u);
        EXPECT_EQ(cache.total_lines(), 0u);
    }

    TEST(ScanCacheTest, ConcurrentRecords) {
        ScanCache cache;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, t] {
                for (int i = 0; i < 50; ++i) {
                    cache.record("t" + std::to_string(t) + "_" + std::to_string(i) + ".ts", {10, 1});
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        EXPECT_EQ(cache.size(), 200u);
        EXPECT_EQ(cache.total_lines(), 200u);
    }

}  // namespace rkg::graph
