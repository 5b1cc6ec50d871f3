#include <gtest/gtest.h>
#include "color_code.hpp"

#include <thread>
#include <vector>

using namespace hilite;

TEST(ColorCodeTest, ForegroundOnly) {
    EXPECT_EQ(color_code::get(1), "\033[38;5;1m");
    EXPECT_EQ(color_code::get(196, std::nullopt), "\033[38;5;196m");
}

TEST(ColorCodeTest, ForegroundAndBackground) {
    EXPECT_EQ(color_code::get(1, 2), "\033[38;5;1m\033[48;5;2m");
}

TEST(ColorCodeTest, BackgroundOnly) {
    EXPECT_EQ(color_code::get(std::nullopt, 4), "\033[48;5;4m");
}

TEST(ColorCodeTest, NoChannelsGivesEmptyCode) {
    EXPECT_EQ(color_code::get(std::nullopt, std::nullopt), "");
}

TEST(ColorCodeTest, OutOfRangeValuesPassThrough) {
    EXPECT_EQ(color_code::get(300), "\033[38;5;300m");
}

TEST(ColorCodeTest, ColorOverload) {
    EXPECT_EQ(color_code::get(Color{3, 4}), color_code::get(3, 4));
}

TEST(ColorCodeTest, ResetCode) {
    EXPECT_EQ(color_code::reset(), "\033[0;0;0m");
    EXPECT_EQ(&color_code::reset(), &color_code::reset());
}

TEST(ColorCodeTest, RepeatedCallsReturnCachedString) {
    const std::string& first = color_code::get(7, 8);
    size_t size = color_code::cache_size();
    const std::string& second = color_code::get(7, 8);
    EXPECT_EQ(first, second);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(color_code::cache_size(), size);
}

TEST(ColorCodeTest, CacheKeyedByValue) {
    Color a{9, std::nullopt};
    Color b{9, std::nullopt};
    EXPECT_EQ(&color_code::get(a), &color_code::get(b));
    EXPECT_NE(&color_code::get(Color{9, 1}), &color_code::get(a));
}

TEST(ColorCodeTest, ColorComparison) {
    EXPECT_EQ((Color{1, 2}), (Color{1, 2}));
    EXPECT_NE((Color{1, 2}), (Color{1, std::nullopt}));
    EXPECT_LT((Color{std::nullopt, 2}), (Color{0, std::nullopt}));
    EXPECT_LT((Color{1, 2}), (Color{1, 3}));
}

TEST(ColorCodeTest, ConcurrentAccess) {
    std::vector<std::thread> threads;
    std::vector<const std::string*> results(8, nullptr);
    for (size_t t = 0; t < results.size(); t++) {
        threads.emplace_back([&results, t]() {
            for (int c = 0; c < 256; c++) color_code::get(c, 17);
            results[t] = &color_code::get(42, 17);
        });
    }
    for (auto& th : threads) th.join();
    for (const auto* r : results) {
        EXPECT_EQ(r, results[0]);
    }
    EXPECT_EQ(*results[0], "\033[38;5;42m\033[48;5;17m");
}
