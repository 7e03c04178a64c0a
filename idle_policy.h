/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef IDLE_POLICY_H
#define IDLE_POLICY_H

#include <optional>
#include <string>
#include <vector>

#include <context.h>
#include <secure_delete.h>
#include <usage_tracker.h>

namespace AppLauncher {

constexpr int64_t SECONDS_PER_DAY = 86400;

//!
//! \brief A normalized absolute path to destroy when the application is idle, with its overwrite pass count. The path
//! does not need to exist.
//!
struct CleanupTarget
{
    fs::path m_path;
    int m_passes = DEFAULT_OVERWRITE_PASSES;
};

//!
//! \brief Per-application idle policy. An absent threshold means the application is never cleaned up.
//!
struct IdlePolicy
{
    std::optional<int> m_threshold_days;
    std::vector<CleanupTarget> m_targets;
};

struct TargetResult
{
    CleanupTarget m_target;
    DeletionReport m_report;
};

//!
//! \brief The EvaluationOutcome class records which terminal state one evaluation reached and, if cleanup ran, the
//! per-target results.
//!
class EvaluationOutcome
{
public:
    enum State {
        UNKNOWN,
        NO_THRESHOLD,      //!< no threshold configured; never cleaned up
        NEVER_LAUNCHED,    //!< no launch record; no evidence to judge idleness against
        STORE_UNAVAILABLE, //!< the store could not be read; treated as not idle
        NOT_IDLE,
        IDLE_NO_TARGETS,   //!< idle, but nothing is configured to clean
        CLEANUP_DONE,
        CLEANUP_PARTIAL    //!< cleanup ran to completion with per-entry failures
    };

    State m_state = UNKNOWN;

    std::optional<int64_t> m_last_launch;

    std::optional<int64_t> m_idle_days;

    std::vector<TargetResult> m_target_results;

    static std::string StateToString(const State& state);

    std::string StateToString() const;

    bool CleanupAttempted() const;
};

//!
//! \brief Whole idle days between the two instants, truncated toward zero. A partial day does not count.
//! \param now Unix Epoch seconds
//! \param last_launch Unix Epoch seconds
//! \return whole days. Negative if last_launch lies more than a day in the future.
//!
int64_t ComputeIdleDays(int64_t now, int64_t last_launch);

//!
//! \brief True for paths that are never destroyed regardless of configuration: the filesystem root and the user's
//! home directory itself.
//!
bool IsProtectedPath(const fs::path& path, const Platform& platform);

//!
//! \brief The IdleDecisionPolicy class combines the usage tracker, an application's idle policy and the secure deleter
//! to decide whether cleanup runs for one application, and runs it.
//!
//! Cleanup happens only when a launch record exists and the idle day count is strictly greater than the threshold.
//! Everything else (no threshold, never launched, store errors, not idle, no targets) is a no-op.
//!
class IdleDecisionPolicy
{
public:
    IdleDecisionPolicy(const RunContext& context, const UsageTracker& tracker, const SecureDeleter& deleter);

    EvaluationOutcome Evaluate(const std::string& app_id, const IdlePolicy& policy) const;

private:
    void RunCleanup(const std::string& app_id, const IdlePolicy& policy, EvaluationOutcome& outcome) const;

    const RunContext& m_context;
    const UsageTracker& m_tracker;
    const SecureDeleter& m_deleter;
};

} // namespace AppLauncher

#endif // IDLE_POLICY_H
