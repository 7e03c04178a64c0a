/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <task_runner.h>

using namespace AppLauncher;

// Class TaskResult

std::string TaskResult::StatusToString(const Status& status)
{
    std::string out;

    switch (status) {
    case UNKNOWN:
        out = "UNKNOWN";
        break;
    case EVALUATED:
        out = "EVALUATED";
        break;
    case SKIPPED_UNINSTALLED:
        out = "SKIPPED_UNINSTALLED";
        break;
    case CONFIG_ERROR:
        out = "CONFIG_ERROR";
        break;
    case FAILED:
        out = "FAILED";
        break;
    }

    return out;
}

std::string TaskResult::StatusToString() const
{
    return StatusToString(m_status);
}

// Class TaskRunner

TaskRunner::TaskRunner(const RunContext& context,
                       const ApplicationRegistry& registry,
                       const ProcessLauncher& launcher,
                       bool check_executable)
    : m_context(context)
    , m_registry(registry)
    , m_launcher(launcher)
    , m_check_executable(check_executable)
    , m_tracker(m_context)
    , m_deleter()
    , m_policy(m_context, m_tracker, m_deleter)
{}

SecureDeleter& TaskRunner::GetDeleter()
{
    return m_deleter;
}

bool TaskRunner::Launch(const std::string& app_id) const
{
    std::vector<std::string> argv;

    try {
        const AppConfig& app = m_registry.GetApplication(app_id);

        argv = SplitCommandLine(app.m_cmd);
    } catch (ConfigException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());
        return false;
    }

    std::optional<fs::path> executable = FindExecutable(argv[0], *m_context.m_platform);

    if (!executable) {
        error_log("%s: App '%s': executable '%s' not found. Check the cmd entry or install the application.",
                  __func__,
                  app_id,
                  argv[0]);
        return false;
    }

    argv[0] = executable->string();

    log("INFO: %s: Launching '%s': %s",
        __func__,
        app_id,
        argv[0]);

    if (!m_launcher.StartDetached(argv)) {
        error_log("%s: App '%s' could not be started.",
                  __func__,
                  app_id);
        return false;
    }

    if (!m_tracker.RecordLaunch(app_id)) {
        log("WARNING: %s: App '%s' was started, but the launch could not be recorded.",
            __func__,
            app_id);
    }

    return true;
}

TaskResult TaskRunner::RunTask(const std::string& app_id) const
{
    try {
        return ProcessTask(app_id);
    } catch (ConfigException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());

        TaskResult result;
        result.m_app_id = app_id;
        result.m_status = TaskResult::CONFIG_ERROR;
        result.m_error = e.what();

        return result;
    } catch (std::exception& e) {
        error_log("%s: App '%s': unexpected error: %s",
                  __func__,
                  app_id,
                  e.what());

        TaskResult result;
        result.m_app_id = app_id;
        result.m_status = TaskResult::FAILED;
        result.m_error = e.what();

        return result;
    }
}

BatchSummary TaskRunner::RunTaskAll() const
{
    BatchSummary summary;

    std::vector<std::string> app_ids = m_registry.GetApplicationIds();

    if (app_ids.empty()) {
        log("INFO: %s: No applications configured. Nothing to do.",
            __func__);

        return summary;
    }

    for (const auto& app_id : app_ids) {
        log("INFO: %s: --- Processing app: %s ---",
            __func__,
            app_id);

        TaskResult result = RunTask(app_id);

        ++summary.m_processed;

        if (result.Failed()) {
            ++summary.m_failed;
        }

        if (result.m_status == TaskResult::EVALUATED && result.m_outcome.CleanupAttempted()) {
            ++summary.m_cleaned;
        }

        summary.m_results.push_back(std::move(result));
    }

    log("INFO: %s: Processed %i app(s): %i cleaned, %i failed.",
        __func__,
        summary.m_processed,
        summary.m_cleaned,
        summary.m_failed);

    return summary;
}

AppStatus TaskRunner::GetStatus(const std::string& app_id) const
{
    const AppConfig& app = m_registry.GetApplication(app_id);

    IdlePolicy policy = ApplicationRegistry::BuildIdlePolicy(app, *m_context.m_platform, m_context.m_overwrite_passes);

    AppStatus status;

    status.m_app_id = app_id;
    status.m_threshold_days = policy.m_threshold_days;
    status.m_lookup = m_tracker.LookupLastLaunch(app_id);

    for (const auto& target : policy.m_targets) {
        status.m_cleanup_paths.push_back(target.m_path);
    }

    if (status.m_lookup.m_status == LaunchLookup::FOUND) {
        status.m_idle_days = ComputeIdleDays(m_context.m_clock->Now(), status.m_lookup.m_last_launch);
    }

    return status;
}

TaskResult TaskRunner::ProcessTask(const std::string& app_id) const
{
    const AppConfig& app = m_registry.GetApplication(app_id);

    TaskResult result;
    result.m_app_id = app_id;

    if (m_check_executable) {
        std::vector<std::string> argv = SplitCommandLine(app.m_cmd);

        if (!FindExecutable(argv[0], *m_context.m_platform)) {
            log("WARNING: %s: App '%s': executable '%s' not found. Assuming the application is uninstalled. "
                "Skipping idle check and cleanup.",
                __func__,
                app_id,
                argv[0]);

            result.m_status = TaskResult::SKIPPED_UNINSTALLED;
            return result;
        }
    }

    IdlePolicy policy = ApplicationRegistry::BuildIdlePolicy(app, *m_context.m_platform, m_context.m_overwrite_passes);

    result.m_outcome = m_policy.Evaluate(app_id, policy);
    result.m_status = TaskResult::EVALUATED;

    debug_log("INFO: %s: App '%s' outcome: %s",
              __func__,
              app_id,
              result.m_outcome.StateToString());

    return result;
}
