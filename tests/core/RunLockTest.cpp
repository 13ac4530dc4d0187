#include "core/RunLock.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <unistd.h>

using namespace podcapture::core;
using namespace podcapture::test;

TEST(RunLockTest, SecondAcquireFailsWhileHeld) {
    TempDir dir;
    const auto marker = dir / ".podcapture.lock";

    auto first = RunLock::tryAcquire(marker);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->held());
    EXPECT_TRUE(fs::exists(marker));
    EXPECT_EQ(readFile(marker), std::to_string(getpid()) + "\n");

    EXPECT_FALSE(RunLock::tryAcquire(marker).has_value());
}

TEST(RunLockTest, ReleaseRemovesMarker) {
    TempDir dir;
    const auto marker = dir / ".podcapture.lock";

    auto lock = RunLock::tryAcquire(marker);
    ASSERT_TRUE(lock.has_value());
    lock->release();
    EXPECT_FALSE(lock->held());
    EXPECT_FALSE(fs::exists(marker));

    EXPECT_TRUE(RunLock::tryAcquire(marker).has_value());
}

TEST(RunLockTest, DestructorReleases) {
    TempDir dir;
    const auto marker = dir / "locks/run.lock";
    {
        auto lock = RunLock::tryAcquire(marker);
        ASSERT_TRUE(lock.has_value());
        EXPECT_TRUE(fs::exists(marker));
    }
    EXPECT_FALSE(fs::exists(marker));
}

TEST(RunLockTest, MoveTransfersOwnership) {
    TempDir dir;
    const auto marker = dir / ".podcapture.lock";

    auto acquired = RunLock::tryAcquire(marker);
    ASSERT_TRUE(acquired.has_value());

    RunLock moved(std::move(*acquired));
    EXPECT_FALSE(acquired->held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(moved.markerFile(), marker);

    acquired.reset();
    EXPECT_TRUE(fs::exists(marker));
}

TEST(RunLockTest, ForeignMarkerIsNotRemoved) {
    TempDir dir;
    const auto marker = dir / ".podcapture.lock";
    writeFile(marker, "12345\n");

    EXPECT_FALSE(RunLock::tryAcquire(marker).has_value());
    EXPECT_TRUE(fs::exists(marker));
}
