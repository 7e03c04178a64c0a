/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef APP_REGISTRY_H
#define APP_REGISTRY_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <idle_policy.h>
#include <util.h>

//!
//! \brief The AppLauncherConfig class is a specialization of the Config class that implements the virtual method
//! ProcessArgs() for the global app_launcher keys. Application keys (app.<id>.<field>) are left raw and are
//! validated by the ApplicationRegistry.
//!
class AppLauncherConfig : public Config
{
protected:
    //!
    //! \brief Application command lines keep their quotes. They are split with shell-style quoting at launch.
    //!
    bool KeepsQuotes(const std::string& key) const override;

private:
    void ProcessArgs() override;
};

namespace AppLauncher {

//!
//! \brief One configured application as read from the config file. Cleanup paths are kept as unexpanded
//! expressions; they are normalized when the idle policy is built.
//!
struct AppConfig
{
    std::string m_id;

    std::string m_cmd;

    std::optional<int> m_max_days_idle;

    std::vector<std::string> m_cleanup_paths;

    std::optional<int> m_overwrite_passes;
};

//!
//! \brief The ApplicationRegistry class holds the validated application entries. Each application is validated on
//! its own: an invalid entry is recorded together with its error, and looking it up throws ConfigException, while
//! valid entries remain usable.
//!
class ApplicationRegistry
{
public:
    ApplicationRegistry();

    //!
    //! \brief Parses and validates all app.<id>.<field> keys of the config. Replaces any previous content.
    //! \param config
    //!
    void Load(const Config& config);

    //!
    //! \brief All configured application identifiers, valid or not, in identifier order.
    //!
    std::vector<std::string> GetApplicationIds() const;

    bool Contains(const std::string& app_id) const;

    //!
    //! \brief Looks up a valid application.
    //! \param app_id
    //! \return the application entry. Throws ConfigException if the application is unknown or invalid.
    //!
    const AppConfig& GetApplication(const std::string& app_id) const;

    //!
    //! \brief Builds the idle policy for an application, normalizing its cleanup paths.
    //! \param app
    //! \param platform
    //! \param default_passes used when the application does not override the overwrite pass count.
    //!
    static IdlePolicy BuildIdlePolicy(const AppConfig& app, const Platform& platform, int default_passes);

    static constexpr const char* APP_KEY_PREFIX = "app.";

private:
    static AppConfig ValidateApplication(const std::string& app_id,
                                         const std::map<std::string, std::vector<std::string>>& fields);

    static int ParsePositiveInteger(const std::string& app_id, const std::string& field, const std::string& value);

    std::map<std::string, AppConfig> m_apps;

    std::map<std::string, ConfigException> m_errors;
};

} // namespace AppLauncher

#endif // APP_REGISTRY_H
