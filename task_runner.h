/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef TASK_RUNNER_H
#define TASK_RUNNER_H

#include <optional>
#include <string>
#include <vector>

#include <app_registry.h>
#include <idle_policy.h>
#include <launcher.h>
#include <secure_delete.h>
#include <usage_tracker.h>

namespace AppLauncher {

class TaskResult
{
public:
    enum Status {
        UNKNOWN,
        EVALUATED,           //!< the idle policy ran; see m_outcome
        SKIPPED_UNINSTALLED, //!< executable not found; nothing evaluated or deleted
        CONFIG_ERROR,
        FAILED
    };

    std::string m_app_id;

    Status m_status = UNKNOWN;

    EvaluationOutcome m_outcome;

    std::string m_error;

    //!
    //! \brief Failed means the application could not be processed (configuration error or unexpected error). No-op
    //! outcomes and partial cleanups are not failures.
    //!
    bool Failed() const { return m_status == CONFIG_ERROR || m_status == FAILED; }

    static std::string StatusToString(const Status& status);

    std::string StatusToString() const;
};

struct BatchSummary
{
    int m_processed = 0;
    int m_failed = 0;
    int m_cleaned = 0;

    std::vector<TaskResult> m_results;
};

//!
//! \brief Read-only view of one application's usage, as reported by the status command.
//!
struct AppStatus
{
    std::string m_app_id;

    LaunchLookup m_lookup;

    std::optional<int64_t> m_idle_days;

    std::optional<int> m_threshold_days;

    std::vector<fs::path> m_cleanup_paths;
};

//!
//! \brief The TaskRunner class implements the launch, task, task-all and status commands on top of the registry,
//! the usage tracker, the idle decision policy and the process launcher.
//!
class TaskRunner
{
public:
    TaskRunner(const RunContext& context,
               const ApplicationRegistry& registry,
               const ProcessLauncher& launcher,
               bool check_executable);

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    //!
    //! \brief Starts the application detached and records the launch. A failure to record is logged as a warning and
    //! does not fail the launch.
    //! \param app_id
    //! \return true if the application was started.
    //!
    bool Launch(const std::string& app_id) const;

    //!
    //! \brief Evaluates the idle policy of one application and cleans up when it is idle. Configuration errors are
    //! reported in the result rather than thrown.
    //!
    TaskResult RunTask(const std::string& app_id) const;

    //!
    //! \brief Runs RunTask for every configured application in identifier order. A failure of one application never
    //! prevents the others from being processed.
    //!
    BatchSummary RunTaskAll() const;

    //!
    //! \brief Throws ConfigException for unknown or invalid applications.
    //!
    AppStatus GetStatus(const std::string& app_id) const;

    SecureDeleter& GetDeleter();

private:
    TaskResult ProcessTask(const std::string& app_id) const;

    RunContext m_context;

    const ApplicationRegistry& m_registry;

    const ProcessLauncher& m_launcher;

    bool m_check_executable;

    UsageTracker m_tracker;

    SecureDeleter m_deleter;

    IdleDecisionPolicy m_policy;
};

} // namespace AppLauncher

#endif // TASK_RUNNER_H
