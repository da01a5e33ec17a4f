#include <gtest/gtest.h>
#include "../main/src/utils.hpp"
#include "../main/src/config.hpp"
#include "../main/src/localization.hpp"
#include <filesystem>
#include <thread>
#include <vector>
#include <future>

namespace fs = std::filesystem;

class LockTest : public ::testing::Test {
protected:
    fs::path test_root;
    fs::path lock_file;

    void SetUp() override {
        init_localization();
        test_root = fs::absolute("tmp_lock_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
        lock_file = get_lock_file(test_root / "media_info");
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(LockTest, BasicLocking) {
    // 1. Acquire lock
    std::unique_ptr<MediaInfoLock> lock1;
    EXPECT_NO_THROW(lock1 = std::make_unique<MediaInfoLock>(lock_file));
    EXPECT_TRUE(fs::exists(lock_file));

    // 2. Attempt to acquire another lock while first is held (should fail)
    EXPECT_THROW(MediaInfoLock lock2(lock_file), GenhdlistException);
}

TEST_F(LockTest, LockReleaseAndReacquire) {
    {
        MediaInfoLock lock1(lock_file);
    } // lock1 released here
    EXPECT_FALSE(fs::exists(lock_file));

    // Should be able to acquire again
    EXPECT_NO_THROW(MediaInfoLock lock2(lock_file));
}

TEST_F(LockTest, ConcurrencyTest) {
    std::promise<void> p;
    auto f = p.get_future();

    // Thread 1 acquires lock and waits
    std::thread t1([this, &p]() {
        MediaInfoLock lock(lock_file);
        p.set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    });

    f.wait(); // Wait for t1 to get the lock

    // Thread 2 tries to get the lock (should fail immediately due to LOCK_NB)
    EXPECT_THROW(MediaInfoLock lock2(lock_file), GenhdlistException);

    t1.join();

    // Now it should succeed
    EXPECT_NO_THROW(MediaInfoLock lock3(lock_file));
}

TEST_F(LockTest, OtherDirectoryIsIndependent) {
    MediaInfoLock lock1(lock_file);
    EXPECT_NO_THROW(MediaInfoLock lock2(get_lock_file(test_root / "other_media_info")));
}
