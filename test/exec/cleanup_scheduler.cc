#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <runlib/exec/cleanup_scheduler.hh>
#include <runlib/exec/language_profile.hh>
#include <runlib/exec/workspace.hh>
#include <runlib/file_info.hh>
#include <runlib/macros/throw.hh>
#include <runlib/temporary_directory.hh>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using runlib::exec::CleanupScheduler;
using runlib::exec::generate_request_id;
using runlib::exec::ProfileRegistry;
using runlib::exec::Workspace;
using runlib::exec::WorkspaceManager;

namespace {

class CleanupSchedulerTest : public ::testing::Test {
protected:
    TemporaryDirectory tmp_dir{"/tmp/runlib-cleanup-scheduler-test.XXXXXX"};
    WorkspaceManager manager{tmp_dir.path()};
    ProfileRegistry registry;

    Workspace new_workspace() {
        return manager.allocate(
            generate_request_id(), *std::move(registry.resolve("c")).unwrap(), "int main(){}",
            "stdin"
        );
    }
};

} // namespace

// NOLINTNEXTLINE
TEST_F(CleanupSchedulerTest, releases_in_background) {
    CleanupScheduler scheduler{[this](Workspace& ws) { manager.release(ws); }, {}};
    std::vector<std::string> dirs;
    for (int i = 0; i < 10; ++i) {
        auto ws = new_workspace();
        dirs.emplace_back(ws.directory());
        scheduler.schedule(std::move(ws));
    }
    scheduler.wait_until_idle();
    for (const auto& dir : dirs) {
        EXPECT_FALSE(path_exists(dir)) << dir;
    }
    EXPECT_EQ(scheduler.given_up_count(), 0U);
}

// NOLINTNEXTLINE
TEST_F(CleanupSchedulerTest, failed_release_is_retried) {
    std::atomic<unsigned> attempts{0};
    CleanupScheduler scheduler{
        [&](Workspace& ws) {
            if (++attempts < 3) {
                THROW("simulated failure");
            }
            manager.release(ws);
        },
        {.grace_period = 0ms, .max_attempts = 3, .retry_delay = 1ms},
    };
    auto ws = new_workspace();
    auto dir = ws.directory();
    scheduler.schedule(std::move(ws));
    scheduler.wait_until_idle();
    EXPECT_EQ(attempts.load(), 3U);
    EXPECT_FALSE(path_exists(dir));
    EXPECT_EQ(scheduler.given_up_count(), 0U);
}

// NOLINTNEXTLINE
TEST_F(CleanupSchedulerTest, gives_up_after_max_attempts) {
    std::atomic<unsigned> attempts{0};
    {
        CleanupScheduler scheduler{
            [&](Workspace& /*ws*/) {
                ++attempts;
                THROW("simulated failure");
            },
            {.grace_period = 0ms, .max_attempts = 2, .retry_delay = 1ms},
        };
        auto ws = new_workspace();
        auto dir = ws.directory();
        scheduler.schedule(std::move(ws));
        scheduler.wait_until_idle();
        EXPECT_EQ(attempts.load(), 2U);
        EXPECT_EQ(scheduler.given_up_count(), 1U);
        // The failure does not stop the scheduler
        auto ws2 = new_workspace();
        scheduler.schedule(std::move(ws2));
        scheduler.wait_until_idle();
        EXPECT_EQ(attempts.load(), 4U);
        EXPECT_EQ(scheduler.given_up_count(), 2U);
        EXPECT_TRUE(path_exists(dir));
    }
}

// NOLINTNEXTLINE
TEST_F(CleanupSchedulerTest, grace_period_delays_release) {
    CleanupScheduler scheduler{
        [this](Workspace& ws) { manager.release(ws); },
        {.grace_period = 300ms, .max_attempts = 1, .retry_delay = 0ms},
    };
    auto ws = new_workspace();
    auto dir = ws.directory();
    auto start = std::chrono::steady_clock::now();
    scheduler.schedule(std::move(ws));
    EXPECT_TRUE(path_exists(dir));
    scheduler.wait_until_idle();
    EXPECT_GE(std::chrono::steady_clock::now() - start, 300ms);
    EXPECT_FALSE(path_exists(dir));
}

// NOLINTNEXTLINE
TEST_F(CleanupSchedulerTest, destructor_drains_pending_releases) {
    std::vector<std::string> dirs;
    {
        CleanupScheduler scheduler{
            [this](Workspace& ws) { manager.release(ws); },
            {.grace_period = 20ms, .max_attempts = 1, .retry_delay = 0ms},
        };
        for (int i = 0; i < 5; ++i) {
            auto ws = new_workspace();
            dirs.emplace_back(ws.directory());
            scheduler.schedule(std::move(ws));
        }
    }
    for (const auto& dir : dirs) {
        EXPECT_FALSE(path_exists(dir)) << dir;
    }
}

// NOLINTNEXTLINE
TEST_F(CleanupSchedulerTest, zero_max_attempts_is_invalid) {
    EXPECT_THROW(
        CleanupScheduler([](Workspace& /*ws*/) {}, {.max_attempts = 0}), std::runtime_error
    );
}
