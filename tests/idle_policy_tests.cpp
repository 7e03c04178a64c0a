/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <idle_policy.h>

#include "test_fakes.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace AppLauncher;

// ============================================================================
// ComputeIdleDays
// ============================================================================

TEST(ComputeIdleDays, WholeDaysOnly)
{
    EXPECT_EQ(ComputeIdleDays(0, 0), 0);
    EXPECT_EQ(ComputeIdleDays(SECONDS_PER_DAY - 1, 0), 0);
    EXPECT_EQ(ComputeIdleDays(SECONDS_PER_DAY, 0), 1);
    EXPECT_EQ(ComputeIdleDays(3 * SECONDS_PER_DAY + 1, 0), 3);
    EXPECT_EQ(ComputeIdleDays(4 * SECONDS_PER_DAY, 0), 4);
}

TEST(ComputeIdleDays, FutureLaunchIsNotPositive)
{
    EXPECT_LE(ComputeIdleDays(0, 10), 0);
    EXPECT_LE(ComputeIdleDays(0, 5 * SECONDS_PER_DAY), 0);
}

// ============================================================================
// IdleDecisionPolicy
// ============================================================================

class IdlePolicyTest : public ::testing::Test
{
protected:
    fs::path m_test_dir;
    std::shared_ptr<FakePlatform> m_platform;
    std::shared_ptr<FixedClock> m_clock;
    RunContext m_context;

    std::unique_ptr<UsageTracker> m_tracker;
    SecureDeleter m_deleter;
    std::unique_ptr<IdleDecisionPolicy> m_policy;

    // 2024-01-01T00:00:00Z
    static constexpr int64_t T0 = 1704067200;

    void SetUp() override
    {
        m_test_dir = fs::temp_directory_path() / "app_launcher_test_idle_policy";
        fs::remove_all(m_test_dir);
        fs::create_directories(m_test_dir / "home");

        m_platform = std::make_shared<FakePlatform>();
        m_platform->m_home = m_test_dir / "home";
        m_clock = std::make_shared<FixedClock>(T0);

        m_context = RunContext::ForStateDirectory(m_test_dir / "state", "state.db", m_clock, m_platform);

        m_tracker = std::make_unique<UsageTracker>(m_context);
        m_policy = std::make_unique<IdleDecisionPolicy>(m_context, *m_tracker, m_deleter);
    }

    void TearDown() override
    {
        fs::remove_all(m_test_dir);
    }

    fs::path MakeCache(const std::string& name)
    {
        fs::path dir = m_test_dir / name;
        fs::create_directories(dir / "nested");

        std::ofstream(dir / "nested" / "blob.bin") << "cached data";
        std::ofstream(dir / "index.txt") << "index";

        return dir;
    }

    IdlePolicy PolicyFor(std::optional<int> threshold, const std::vector<fs::path>& paths, int passes = 1)
    {
        IdlePolicy policy;
        policy.m_threshold_days = threshold;

        for (const auto& path : paths) {
            policy.m_targets.push_back(CleanupTarget {path, passes});
        }

        return policy;
    }

    //!
    //! \brief Records a launch at T0 and moves the clock to T0 + elapsed seconds.
    //!
    void LaunchedAgo(int64_t elapsed)
    {
        m_clock->Set(T0);
        ASSERT_TRUE(m_tracker->RecordLaunch("editor"));
        m_clock->Set(T0 + elapsed);
    }
};

TEST_F(IdlePolicyTest, NoThresholdNeverCleans)
{
    fs::path cache = MakeCache("cache");
    LaunchedAgo(1000 * SECONDS_PER_DAY);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(std::nullopt, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::NO_THRESHOLD);
    EXPECT_FALSE(outcome.CleanupAttempted());
    EXPECT_TRUE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, NeverLaunchedIsSkipped)
{
    fs::path cache = MakeCache("cache");

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(1, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::NEVER_LAUNCHED);
    EXPECT_TRUE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, ExactlyAtThresholdIsNotIdle)
{
    fs::path cache = MakeCache("cache");
    LaunchedAgo(3 * SECONDS_PER_DAY);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::NOT_IDLE);
    ASSERT_TRUE(outcome.m_idle_days.has_value());
    EXPECT_EQ(*outcome.m_idle_days, 3);
    EXPECT_TRUE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, PartialDayDoesNotCount)
{
    fs::path cache = MakeCache("cache");
    LaunchedAgo(3 * SECONDS_PER_DAY + 1);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::NOT_IDLE);
    EXPECT_TRUE(fs::exists(cache));

    m_clock->Set(T0 + 4 * SECONDS_PER_DAY - 1);
    outcome = m_policy->Evaluate("editor", PolicyFor(3, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::NOT_IDLE);
    EXPECT_TRUE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, BeyondThresholdCleansUp)
{
    fs::path cache = MakeCache("cache");
    fs::path config = MakeCache("config");
    LaunchedAgo(4 * SECONDS_PER_DAY);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {cache, config}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::CLEANUP_DONE);
    EXPECT_TRUE(outcome.CleanupAttempted());
    ASSERT_EQ(outcome.m_target_results.size(), 2u);
    EXPECT_EQ(outcome.m_target_results[0].m_target.m_path, cache);
    EXPECT_EQ(outcome.m_target_results[1].m_target.m_path, config);
    EXPECT_FALSE(fs::exists(cache));
    EXPECT_FALSE(fs::exists(config));
}

TEST_F(IdlePolicyTest, MissingTargetStillDone)
{
    LaunchedAgo(10 * SECONDS_PER_DAY);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {m_test_dir / "never_created"}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::CLEANUP_DONE);
    ASSERT_EQ(outcome.m_target_results.size(), 1u);
    EXPECT_FALSE(outcome.m_target_results[0].m_report.m_existed);
}

TEST_F(IdlePolicyTest, FutureLaunchIsNotIdle)
{
    fs::path cache = MakeCache("cache");

    m_clock->Set(T0 + 10 * SECONDS_PER_DAY);
    ASSERT_TRUE(m_tracker->RecordLaunch("editor"));
    m_clock->Set(T0);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(1, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::NOT_IDLE);
    EXPECT_TRUE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, IdleWithoutTargets)
{
    LaunchedAgo(10 * SECONDS_PER_DAY);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::IDLE_NO_TARGETS);
    EXPECT_FALSE(outcome.CleanupAttempted());
}

TEST_F(IdlePolicyTest, StoreUnavailableIsNotIdle)
{
    fs::path cache = MakeCache("cache");
    LaunchedAgo(10 * SECONDS_PER_DAY);

    m_context.m_lock_timeout = std::chrono::milliseconds(50);
    UsageTracker tracker(m_context);
    IdleDecisionPolicy policy(m_context, tracker, m_deleter);

    PosixPlatform other_process;
    auto held_lock = other_process.AcquireLock(m_context.m_lock_path, std::chrono::milliseconds(0));

    EvaluationOutcome outcome = policy.Evaluate("editor", PolicyFor(3, {cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::STORE_UNAVAILABLE);
    EXPECT_TRUE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, ProtectedPathsAreRefused)
{
    fs::path cache = MakeCache("cache");
    fs::path home = m_test_dir / "home";
    std::ofstream(home / "document.txt") << "do not delete";

    LaunchedAgo(10 * SECONDS_PER_DAY);

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {home, fs::path("/"), cache}));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::CLEANUP_PARTIAL);
    ASSERT_EQ(outcome.m_target_results.size(), 3u);
    EXPECT_FALSE(outcome.m_target_results[0].m_report.Succeeded());
    EXPECT_FALSE(outcome.m_target_results[1].m_report.Succeeded());
    EXPECT_TRUE(outcome.m_target_results[2].m_report.Succeeded());

    EXPECT_TRUE(fs::exists(home / "document.txt"));
    EXPECT_FALSE(fs::exists(cache));
}

TEST_F(IdlePolicyTest, PassesFollowTarget)
{
    fs::path cache = MakeCache("cache");
    LaunchedAgo(10 * SECONDS_PER_DAY);

    int max_pass = 0;
    m_deleter.SetPassObserver([&](const fs::path&, int pass, uintmax_t) { max_pass = std::max(max_pass, pass); });

    EvaluationOutcome outcome = m_policy->Evaluate("editor", PolicyFor(3, {cache}, 5));

    EXPECT_EQ(outcome.m_state, EvaluationOutcome::CLEANUP_DONE);
    EXPECT_EQ(max_pass, 5);
}

TEST(IsProtectedPath, RootHomeAndEmpty)
{
    FakePlatform platform;
    platform.m_home = fs::path("/home/someone");

    EXPECT_TRUE(IsProtectedPath(fs::path("/"), platform));
    EXPECT_TRUE(IsProtectedPath(fs::path {}, platform));
    EXPECT_TRUE(IsProtectedPath(fs::path("/home/someone"), platform));
    EXPECT_TRUE(IsProtectedPath(fs::path("/home/someone/"), platform));
    EXPECT_FALSE(IsProtectedPath(fs::path("/home/someone/.cache"), platform));
    EXPECT_FALSE(IsProtectedPath(fs::path("/home"), platform));
}
