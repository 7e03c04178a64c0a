/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <algorithm>

#include <app_registry.h>
#include <launcher.h>
#include <path_normalizer.h>

// Class AppLauncherConfig

bool AppLauncherConfig::KeepsQuotes(const std::string& key) const
{
    const std::string prefix(AppLauncher::ApplicationRegistry::APP_KEY_PREFIX);
    const std::string suffix(".cmd");

    return key.size() > prefix.size() + suffix.size()
           && key.compare(0, prefix.size(), prefix) == 0
           && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void AppLauncherConfig::ProcessArgs()
{
    // debug

    std::string debug_arg = GetArgString("debug", "false");

    if (debug_arg == "1" || ToLower(debug_arg) == "true") {
        m_config.insert(std::make_pair("debug", true));
    } else if (debug_arg == "0" || ToLower(debug_arg) == "false") {
        m_config.insert(std::make_pair("debug", false));
    } else {
        error_log("%s: debug parameter in config file has invalid value: %s",
                  __func__,
                  debug_arg);

        m_config.insert(std::make_pair("debug", false));
    }

    // state_dir. Left empty when not configured so that main() can place it under the platform state base directory.
    // The expression is normalized by main() with the Path Normalizer.

    m_config.insert(std::make_pair("state_dir", GetArgString("state_dir", "")));

    // state_db_filename

    std::string state_db_filename = GetArgString("state_db_filename", "state.db");

    if (state_db_filename.empty() || state_db_filename.find('/') != std::string::npos) {
        error_log("%s: state_db_filename parameter in config file has invalid value: %s. Using state.db.",
                  __func__,
                  state_db_filename);

        state_db_filename = "state.db";
    }

    m_config.insert(std::make_pair("state_db_filename", state_db_filename));

    // overwrite_passes

    int overwrite_passes = AppLauncher::DEFAULT_OVERWRITE_PASSES;

    try {
        int passes_arg = ParseStringToInt(GetArgString("overwrite_passes",
                                                       ToString(AppLauncher::DEFAULT_OVERWRITE_PASSES)));

        if (passes_arg >= 1) {
            overwrite_passes = passes_arg;
        } else {
            error_log("%s: overwrite_passes parameter in config file must be at least 1, got %i. Using %i.",
                      __func__,
                      passes_arg,
                      overwrite_passes);
        }
    } catch (std::exception& e) {
        error_log("%s: overwrite_passes parameter in config file has invalid value: %s",
                  __func__,
                  e.what());
    }

    m_config.insert(std::make_pair("overwrite_passes", overwrite_passes));

    // lock_timeout_ms

    int lock_timeout_ms = static_cast<int>(AppLauncher::DEFAULT_LOCK_TIMEOUT.count());

    try {
        int timeout_arg = ParseStringToInt(GetArgString("lock_timeout_ms", ToString(lock_timeout_ms)));

        if (timeout_arg >= 0) {
            lock_timeout_ms = timeout_arg;
        } else {
            error_log("%s: lock_timeout_ms parameter in config file cannot be negative, got %i. Using %i.",
                      __func__,
                      timeout_arg,
                      lock_timeout_ms);
        }
    } catch (std::exception& e) {
        error_log("%s: lock_timeout_ms parameter in config file has invalid value: %s",
                  __func__,
                  e.what());
    }

    m_config.insert(std::make_pair("lock_timeout_ms", lock_timeout_ms));

    // check_executable

    std::string check_executable_arg = GetArgString("check_executable", "true");

    if (check_executable_arg == "1" || ToLower(check_executable_arg) == "true") {
        m_config.insert(std::make_pair("check_executable", true));
    } else if (check_executable_arg == "0" || ToLower(check_executable_arg) == "false") {
        m_config.insert(std::make_pair("check_executable", false));
    } else {
        error_log("%s: check_executable parameter in config file has invalid value: %s",
                  __func__,
                  check_executable_arg);

        m_config.insert(std::make_pair("check_executable", true));
    }
}

namespace AppLauncher {

// Class ApplicationRegistry

ApplicationRegistry::ApplicationRegistry()
{}

void ApplicationRegistry::Load(const Config& config)
{
    m_apps.clear();
    m_errors.clear();

    // app id -> field -> values in file order
    std::map<std::string, std::map<std::string, std::vector<std::string>>> raw_apps;

    const std::string prefix(APP_KEY_PREFIX);

    for (const auto& [key, value] : config.GetArgsWithPrefix(prefix)) {
        std::string rest = key.substr(prefix.size());

        // The field name follows the last '.', so identifiers may themselves contain dots.
        size_t field_pos = rest.rfind('.');

        if (field_pos == std::string::npos || field_pos == 0 || field_pos + 1 == rest.size()) {
            log("WARNING: %s: Ignoring malformed application key '%s'. Expected app.<id>.<field>.",
                __func__,
                key);
            continue;
        }

        raw_apps[rest.substr(0, field_pos)][rest.substr(field_pos + 1)].push_back(value);
    }

    for (const auto& [app_id, fields] : raw_apps) {
        try {
            m_apps.emplace(app_id, ValidateApplication(app_id, fields));

            debug_log("INFO: %s: Registered application '%s'",
                      __func__,
                      app_id);
        } catch (ConfigException& e) {
            error_log("%s: %s",
                      __func__,
                      e.what());

            m_errors.emplace(app_id, e);
        }
    }

    debug_log("INFO: %s: %u valid and %u invalid application(s) configured",
              __func__,
              m_apps.size(),
              m_errors.size());
}

std::vector<std::string> ApplicationRegistry::GetApplicationIds() const
{
    std::vector<std::string> app_ids;

    for (const auto& iter : m_apps) {
        app_ids.push_back(iter.first);
    }

    for (const auto& iter : m_errors) {
        app_ids.push_back(iter.first);
    }

    std::sort(app_ids.begin(), app_ids.end());

    return app_ids;
}

bool ApplicationRegistry::Contains(const std::string& app_id) const
{
    return m_apps.count(app_id) || m_errors.count(app_id);
}

const AppConfig& ApplicationRegistry::GetApplication(const std::string& app_id) const
{
    auto iter = m_apps.find(app_id);

    if (iter != m_apps.end()) {
        return iter->second;
    }

    auto error_iter = m_errors.find(app_id);

    if (error_iter != m_errors.end()) {
        throw error_iter->second;
    }

    throw ConfigException("Unknown app. Configure it in the config file with app." + app_id + ".cmd.", app_id);
}

IdlePolicy ApplicationRegistry::BuildIdlePolicy(const AppConfig& app, const Platform& platform, int default_passes)
{
    IdlePolicy policy;

    policy.m_threshold_days = app.m_max_days_idle;

    int passes = app.m_overwrite_passes.value_or(default_passes);

    for (const auto& path : NormalizePaths(app.m_cleanup_paths, platform)) {
        policy.m_targets.push_back(CleanupTarget {path, passes});
    }

    return policy;
}

AppConfig ApplicationRegistry::ValidateApplication(const std::string& app_id,
                                                   const std::map<std::string, std::vector<std::string>>& fields)
{
    AppConfig app;
    app.m_id = app_id;

    if (app_id.find_first_of(" \t") != std::string::npos) {
        throw ConfigException("Application identifier cannot contain whitespace.", app_id);
    }

    for (const auto& [field, values] : fields) {
        if (field == "cmd") {
            if (values.size() > 1) {
                throw ConfigException("'cmd' is defined more than once.", app_id);
            }

            if (values[0].empty()) {
                throw ConfigException("'cmd' must be a non-empty command line.", app_id);
            }

            // Throws ConfigException on unbalanced quoting.
            std::vector<std::string> argv;

            try {
                argv = SplitCommandLine(values[0]);
            } catch (ConfigException& e) {
                throw ConfigException(e.what(), app_id);
            }

            if (argv.empty()) {
                throw ConfigException("'cmd' must be a non-empty command line.", app_id);
            }

            app.m_cmd = values[0];
        } else if (field == "max_days_idle") {
            if (values.size() > 1) {
                throw ConfigException("'max_days_idle' is defined more than once.", app_id);
            }

            app.m_max_days_idle = ParsePositiveInteger(app_id, field, values[0]);
        } else if (field == "cleanup_path") {
            for (const auto& value : values) {
                if (value.empty()) {
                    throw ConfigException("All items in 'cleanup_path' must be non-empty path strings.", app_id);
                }

                app.m_cleanup_paths.push_back(value);
            }
        } else if (field == "overwrite_passes") {
            if (values.size() > 1) {
                throw ConfigException("'overwrite_passes' is defined more than once.", app_id);
            }

            app.m_overwrite_passes = ParsePositiveInteger(app_id, field, values[0]);
        } else {
            log("WARNING: %s: App '%s': ignoring unknown field '%s'.",
                __func__,
                app_id,
                field);
        }
    }

    if (app.m_cmd.empty()) {
        throw ConfigException("Missing required field 'cmd'.", app_id);
    }

    return app;
}

int ApplicationRegistry::ParsePositiveInteger(const std::string& app_id, const std::string& field, const std::string& value)
{
    // Digits only: std::stoi alone would accept "3days" or "3.5".
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigException("'" + field + "' must be a positive integer, got: '" + value + "'.", app_id);
    }

    int result = 0;

    try {
        result = ParseStringToInt(value);
    } catch (std::exception&) {
        throw ConfigException("'" + field + "' is out of range: '" + value + "'.", app_id);
    }

    if (result <= 0) {
        throw ConfigException("'" + field + "' must be a positive integer, got: '" + value + "'.", app_id);
    }

    return result;
}

} // namespace AppLauncher
