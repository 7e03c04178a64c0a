/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <cstring>

#include <app_registry.h>
#include <path_normalizer.h>
#include <release.h>
#include <task_runner.h>

//!
//! \brief Process exit codes.
//!
enum ExitCode {
    EXIT_OK = 0,
    EXIT_ERROR = 1,
    EXIT_USAGE = 2
};

//!
//! \brief Global config object for app_launcher.
//!
AppLauncherConfig g_config;

namespace {

void PrintUsage()
{
    error_log("Usage: app_launcher <config_file> <command> [app]\n"
              "Commands:\n"
              "  launch <app>    start the application detached and record the launch\n"
              "  task <app>      check the idle threshold of the application and clean up if it is idle\n"
              "  task-all        run task for every configured application\n"
              "  status [app]    show last launch and idle days without changing anything\n"
              "  version         show the version");
}

void PrintStatus(const AppLauncher::AppStatus& status)
{
    using AppLauncher::LaunchLookup;

    std::string last_launch;

    switch (status.m_lookup.m_status) {
    case LaunchLookup::FOUND:
        last_launch = FormatISO8601DateTime(status.m_lookup.m_last_launch);
        break;
    case LaunchLookup::ABSENT:
        last_launch = "never";
        break;
    case LaunchLookup::STORE_ERROR:
        last_launch = "unavailable";
        break;
    }

    log("INFO: %s: %s: last launch %s, idle days %s, max days idle %s, %u cleanup path(s)",
        __func__,
        status.m_app_id,
        last_launch,
        status.m_idle_days ? ToString(*status.m_idle_days) : std::string("n/a"),
        status.m_threshold_days ? ToString(*status.m_threshold_days) : std::string("none"),
        status.m_cleanup_paths.size());

    for (const auto& path : status.m_cleanup_paths) {
        log("INFO: %s: %s:   %s",
            __func__,
            status.m_app_id,
            path);
    }
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    const char* journal_stream = getenv("JOURNAL_STREAM");
    if (journal_stream != nullptr && strlen(journal_stream) > 0) {
        // If JOURNAL_STREAM is set, assume output is handled by journald
        g_log_timestamps.store(false);
    } else {
        g_log_timestamps.store(true);
    }

    if (argc == 2 && std::string(argv[1]) == "version") {
        log("app_launcher %s", g_version);
        return EXIT_OK;
    }

    if (argc < 3 || argc > 4) {
        PrintUsage();
        return EXIT_USAGE;
    }

    fs::path config_file_path(argv[1]);
    std::string command(argv[2]);
    std::string app_id = (argc == 4) ? std::string(argv[3]) : std::string {};

    bool needs_app = (command == "launch" || command == "task");

    if (command != "launch" && command != "task" && command != "task-all" && command != "status"
        && command != "version") {
        error_log("%s: Unknown command \"%s\".",
                  __func__,
                  command);
        PrintUsage();
        return EXIT_USAGE;
    }

    if ((needs_app && app_id.empty()) || (command == "task-all" && !app_id.empty())) {
        PrintUsage();
        return EXIT_USAGE;
    }

    if (command == "version") {
        log("app_launcher %s", g_version);
        return EXIT_OK;
    }

    // --- Configuration Loading ---
    //
    // A missing config file is fatal. Nothing destructive runs without configuration.
    if (!fs::exists(config_file_path) || !fs::is_regular_file(config_file_path)) {
        error_log("%s: Config file not found: %s",
                  __func__,
                  config_file_path);
        return EXIT_ERROR;
    }

    try {
        if (!g_config.ReadAndUpdateConfig(config_file_path)) {
            error_log("%s: Failed to read config file %s",
                      __func__,
                      config_file_path);
            return EXIT_ERROR;
        }
    } catch (const std::exception& e) {
        error_log("%s: Failed to read/process config: %s",
                  __func__,
                  e.what());
        return EXIT_ERROR;
    }

    g_debug = std::get<bool>(g_config.GetArg("debug"));

    debug_log("INFO: %s: app_launcher %s, using config from %s",
              __func__,
              g_version,
              config_file_path);

    auto platform = std::make_shared<AppLauncher::PosixPlatform>();
    auto clock = std::make_shared<AppLauncher::SystemClock>();

    try {
        std::string state_dir_arg = std::get<std::string>(g_config.GetArg("state_dir"));

        fs::path state_dir = state_dir_arg.empty()
                                 ? platform->GetStateBaseDirectory() / ".app_launch_tracker"
                                 : AppLauncher::NormalizePath(state_dir_arg, *platform);

        AppLauncher::RunContext context =
            AppLauncher::RunContext::ForStateDirectory(state_dir,
                                                       std::get<std::string>(g_config.GetArg("state_db_filename")),
                                                       clock,
                                                       platform);

        context.m_overwrite_passes = std::get<int>(g_config.GetArg("overwrite_passes"));
        context.m_lock_timeout = std::chrono::milliseconds(std::get<int>(g_config.GetArg("lock_timeout_ms")));

        debug_log("INFO: %s: Using state store %s",
                  __func__,
                  context.m_store_path);

        AppLauncher::ApplicationRegistry registry;
        registry.Load(g_config);

        AppLauncher::PosixProcessLauncher launcher;

        AppLauncher::TaskRunner runner(context, registry, launcher, std::get<bool>(g_config.GetArg("check_executable")));

        if (command == "launch") {
            return runner.Launch(app_id) ? EXIT_OK : EXIT_ERROR;
        }

        if (command == "task") {
            AppLauncher::TaskResult result = runner.RunTask(app_id);

            return result.Failed() ? EXIT_ERROR : EXIT_OK;
        }

        if (command == "task-all") {
            AppLauncher::BatchSummary summary = runner.RunTaskAll();

            return summary.m_failed > 0 ? EXIT_ERROR : EXIT_OK;
        }

        // status
        std::vector<std::string> app_ids;

        if (app_id.empty()) {
            app_ids = registry.GetApplicationIds();

            if (app_ids.empty()) {
                log("INFO: %s: No applications configured.",
                    __func__);
            }
        } else {
            app_ids.push_back(app_id);
        }

        int exit_code = EXIT_OK;

        for (const auto& id : app_ids) {
            try {
                PrintStatus(runner.GetStatus(id));
            } catch (ConfigException& e) {
                error_log("%s: %s",
                          __func__,
                          e.what());
                exit_code = EXIT_ERROR;
            }
        }

        return exit_code;
    } catch (const std::bad_variant_access& e) {
        error_log("%s: Configuration value missing or has wrong type: %s",
                  __func__,
                  e.what());
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        error_log("%s: Fatal error: %s",
                  __func__,
                  e.what());
        return EXIT_ERROR;
    }
}
