/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <idle_policy.h>

using namespace AppLauncher;

namespace {

fs::path WithoutTrailingSeparator(const fs::path& path)
{
    fs::path normal = path.lexically_normal();

    if (!normal.has_filename() && normal.has_relative_path()) {
        return normal.parent_path();
    }

    return normal;
}

} // anonymous namespace

// Class EvaluationOutcome

std::string EvaluationOutcome::StateToString(const State& state)
{
    std::string out;

    switch (state) {
    case UNKNOWN:
        out = "UNKNOWN";
        break;
    case NO_THRESHOLD:
        out = "NO_THRESHOLD";
        break;
    case NEVER_LAUNCHED:
        out = "NEVER_LAUNCHED";
        break;
    case STORE_UNAVAILABLE:
        out = "STORE_UNAVAILABLE";
        break;
    case NOT_IDLE:
        out = "NOT_IDLE";
        break;
    case IDLE_NO_TARGETS:
        out = "IDLE_NO_TARGETS";
        break;
    case CLEANUP_DONE:
        out = "CLEANUP_DONE";
        break;
    case CLEANUP_PARTIAL:
        out = "CLEANUP_PARTIAL";
        break;
    }

    return out;
}

std::string EvaluationOutcome::StateToString() const
{
    return StateToString(m_state);
}

bool EvaluationOutcome::CleanupAttempted() const
{
    return m_state == CLEANUP_DONE || m_state == CLEANUP_PARTIAL;
}

namespace AppLauncher {

int64_t ComputeIdleDays(int64_t now, int64_t last_launch)
{
    // Integer division truncates toward zero.
    return (now - last_launch) / SECONDS_PER_DAY;
}

bool IsProtectedPath(const fs::path& path, const Platform& platform)
{
    fs::path normal = WithoutTrailingSeparator(path);

    if (normal.empty() || !normal.has_relative_path()) {
        return true;
    }

    std::optional<fs::path> home = platform.GetHomeDirectory();

    if (home) {
        if (normal == WithoutTrailingSeparator(*home)) {
            return true;
        }

        std::error_code ec;
        fs::path canonical_home = fs::weakly_canonical(*home, ec);

        if (!ec && normal == WithoutTrailingSeparator(canonical_home)) {
            return true;
        }
    }

    return false;
}

} // namespace AppLauncher

// Class IdleDecisionPolicy

IdleDecisionPolicy::IdleDecisionPolicy(const RunContext& context, const UsageTracker& tracker, const SecureDeleter& deleter)
    : m_context(context)
    , m_tracker(tracker)
    , m_deleter(deleter)
{}

EvaluationOutcome IdleDecisionPolicy::Evaluate(const std::string& app_id, const IdlePolicy& policy) const
{
    EvaluationOutcome outcome;

    if (!policy.m_threshold_days) {
        log("INFO: %s: No idle threshold configured for '%s'. Nothing to do.",
            __func__,
            app_id);

        outcome.m_state = EvaluationOutcome::NO_THRESHOLD;
        return outcome;
    }

    int threshold_days = *policy.m_threshold_days;

    if (threshold_days <= 0) {
        error_log("%s: Idle threshold for '%s' must be a positive integer, got %i. Nothing will be deleted.",
                  __func__,
                  app_id,
                  threshold_days);

        outcome.m_state = EvaluationOutcome::NO_THRESHOLD;
        return outcome;
    }

    LaunchLookup lookup = m_tracker.LookupLastLaunch(app_id);

    if (lookup.m_status == LaunchLookup::STORE_ERROR) {
        log("WARNING: %s: Launch history for '%s' is unavailable. Treating as not idle.",
            __func__,
            app_id);

        outcome.m_state = EvaluationOutcome::STORE_UNAVAILABLE;
        return outcome;
    }

    if (lookup.m_status == LaunchLookup::ABSENT) {
        log("INFO: %s: App '%s' has never been launched (no record). Skipping cleanup.",
            __func__,
            app_id);

        outcome.m_state = EvaluationOutcome::NEVER_LAUNCHED;
        return outcome;
    }

    int64_t now = m_context.m_clock->Now();
    int64_t idle_days = ComputeIdleDays(now, lookup.m_last_launch);

    outcome.m_last_launch = lookup.m_last_launch;
    outcome.m_idle_days = idle_days;

    log("INFO: %s: App '%s' last launch: %s (%lld days ago)",
        __func__,
        app_id,
        FormatISO8601DateTime(lookup.m_last_launch),
        idle_days);

    // Exactly at the threshold is not idle yet.
    if (idle_days <= threshold_days) {
        log("INFO: %s: App '%s' status: OK, not idle long enough (idle %lld days, max %i).",
            __func__,
            app_id,
            idle_days,
            threshold_days);

        outcome.m_state = EvaluationOutcome::NOT_IDLE;
        return outcome;
    }

    if (policy.m_targets.empty()) {
        log("INFO: %s: App '%s' is idle, but no cleanup paths are configured. Skipping deletion.",
            __func__,
            app_id);

        outcome.m_state = EvaluationOutcome::IDLE_NO_TARGETS;
        return outcome;
    }

    log("INFO: %s: App '%s' idle threshold exceeded (%lld > %i days). Proceeding to secure delete.",
        __func__,
        app_id,
        idle_days,
        threshold_days);

    RunCleanup(app_id, policy, outcome);

    return outcome;
}

void IdleDecisionPolicy::RunCleanup(const std::string& app_id, const IdlePolicy& policy, EvaluationOutcome& outcome) const
{
    bool all_succeeded = true;

    for (const auto& target : policy.m_targets) {
        TargetResult result;
        result.m_target = target;

        if (IsProtectedPath(target.m_path, *m_context.m_platform)) {
            error_log("%s: Refusing to destroy protected path %s configured for '%s'.",
                      __func__,
                      target.m_path,
                      app_id);

            result.m_report.m_target = target.m_path;
            result.m_report.m_failures.push_back(DeletionFailure {target.m_path, "protected path"});
        } else {
            log("INFO: %s: Securely deleting %s for '%s'",
                __func__,
                target.m_path,
                app_id);

            result.m_report = m_deleter.Destroy(target.m_path, target.m_passes);
        }

        if (!result.m_report.Succeeded()) {
            all_succeeded = false;
        }

        outcome.m_target_results.push_back(std::move(result));
    }

    outcome.m_state = all_succeeded ? EvaluationOutcome::CLEANUP_DONE : EvaluationOutcome::CLEANUP_PARTIAL;

    if (all_succeeded) {
        log("INFO: %s: Cleanup of '%s' complete.",
            __func__,
            app_id);
    } else {
        log("WARNING: %s: Cleanup of '%s' was partial. See warnings above for the entries that failed.",
            __func__,
            app_id);
    }
}
