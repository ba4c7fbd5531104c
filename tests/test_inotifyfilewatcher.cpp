// tests/test_inotifyfilewatcher.cpp
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/config/CacheConfig.hpp"
#include "../src/core/CacheProvider.hpp"
#include "../src/store/InMemoryStore.hpp"
#include "../src/watcher/InotifyFileWatcher.hpp"

using ::testing::NiceMock;

namespace {
    // Polls cond until it holds or the timeout passes.
    template <typename Cond>
    bool waitFor(Cond cond, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cond()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return cond();
    }
}

class InotifyFileWatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<InotifyFileWatcher> watcher_ =
        std::make_shared<InotifyFileWatcher>(logger_, std::chrono::milliseconds(50));
};

TEST_F(InotifyFileWatcherTest, WatchMissingFileThrowsFileNotFound) {
    EXPECT_THROW(watcher_->watch("/nonexistent/dir/file.cfg", [](const std::string&) {}), FileNotFoundException);
    EXPECT_EQ(watcher_->activeWatchCount(), 0u);
}

TEST_F(InotifyFileWatcherTest, ModificationFiresCallback) {
    TempFile file("watch_modify");
    auto calls = std::make_shared<std::atomic<int>>(0);
    watcher_->watch(file.path(), [calls](const std::string&) { (*calls)++; });

    file.write("v2");

    EXPECT_TRUE(waitFor([calls] { return calls->load() > 0; }));
}

TEST_F(InotifyFileWatcherTest, DeletionFiresCallbackAndHandleGoesInert) {
    TempFile file("watch_delete");
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto handle = watcher_->watch(file.path(), [calls](const std::string&) { (*calls)++; });

    std::filesystem::remove(file.path());

    EXPECT_TRUE(waitFor([calls] { return calls->load() > 0; }));
    EXPECT_TRUE(waitFor([this] { return watcher_->activeWatchCount() == 0; }));
    EXPECT_NO_THROW(watcher_->unwatch(handle));
}

TEST_F(InotifyFileWatcherTest, UnwatchStopsNotifications) {
    TempFile file("watch_unwatch");
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto handle = watcher_->watch(file.path(), [calls](const std::string&) { (*calls)++; });
    watcher_->unwatch(handle);
    EXPECT_EQ(watcher_->activeWatchCount(), 0u);

    file.write("v2");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(calls->load(), 0);
}

TEST_F(InotifyFileWatcherTest, HandlesOnSameFileAreIndependent) {
    TempFile file("watch_shared");
    auto first = std::make_shared<std::atomic<int>>(0);
    auto second = std::make_shared<std::atomic<int>>(0);
    auto first_handle = watcher_->watch(file.path(), [first](const std::string&) { (*first)++; });
    watcher_->watch(file.path(), [second](const std::string&) { (*second)++; });

    watcher_->unwatch(first_handle);
    file.write("v2");

    EXPECT_TRUE(waitFor([second] { return second->load() > 0; }));
    EXPECT_EQ(first->load(), 0);
    EXPECT_EQ(watcher_->activeWatchCount(), 1u);
}

TEST_F(InotifyFileWatcherTest, ThrowingCallbackIsLoggedAndWatcherKeepsRunning) {
    TempFile bad("watch_throw");
    TempFile good("watch_after_throw");
    auto calls = std::make_shared<std::atomic<int>>(0);
    EXPECT_CALL(*logger_, error(::testing::HasSubstr("boom"))).Times(::testing::AtLeast(1));

    watcher_->watch(bad.path(), [](const std::string&) { throw std::runtime_error("boom"); });
    watcher_->watch(good.path(), [calls](const std::string&) { (*calls)++; });

    bad.write("v2");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    good.write("v2");

    EXPECT_TRUE(waitFor([calls] { return calls->load() > 0; }));
}

// End to end: a real file edit invalidates a cached entry within bounded latency.
TEST_F(InotifyFileWatcherTest, ExternalFileEditInvalidatesCacheEntry) {
    CacheConfig config;
    auto store = std::make_shared<InMemoryStore>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    CacheProvider cache(config, store, watcher_, logger_, statsd);

    TempFile file("watch_provider");
    cache.set("settings", std::string("parsed-v1"), file.path());
    ASSERT_TRUE(cache.isSet("settings"));
    EXPECT_EQ(watcher_->activeWatchCount(), 1u);

    file.write("v2");

    EXPECT_TRUE(waitFor([&cache] { return !cache.isSet("settings"); }));
    EXPECT_EQ(cache.get<std::string>("settings"), "");
    // Purging the dead entry released its watch.
    EXPECT_EQ(watcher_->activeWatchCount(), 0u);
}
