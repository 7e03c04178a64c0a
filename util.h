/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef UTIL_H
#define UTIL_H

#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <tinyformat.h>
#include <variant>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

extern std::atomic<bool> g_debug;
extern std::atomic<bool> g_log_timestamps;

//!
//! /brief Locale-independent version of std::to_string
//!
template <typename T>
std::string ToString(const T& t)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << t;
    return oss.str();
}

//!
//! \brief Utility function to split string by the provided delimiter. Note that no trimming is done to remove white space.
//! \param s: the string to split
//! \param delim: the delimiter string
//! \return std::vector of string parts
//!
[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim);

//!
//! \brief Utility function to trim whitespace from the beginning and end of a string.
//! \param str: the string to trim
//! \param pattern: the pattern to trim, defaulting to " \f\n\r\t\v"
//! \return trimmed string
//!
[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

//!
//! \brief Utility function to remove enclosing single or double quotes from a string. This is especially useful when
//! dealing with quoted values in a config file.
//! \param str: the input string with potential quotes to remove
//! \return the string with any enclosing quotes removed
//!
[[nodiscard]] std::string StripQuotes(const std::string& str);

/**
 * Converts the given character to its lowercase equivalent.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 * This is a feature, not a limitation.
 *
 * @param[in] c     the character to convert to lowercase.
 * @return          the lowercase equivalent of c; or the argument
 *                  if no conversion is possible.
 */
constexpr char ToLower(char c);

/**
 * Returns the lowercase equivalent of the given string.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 * This is a feature, not a limitation.
 *
 * @param[in] str   the string to convert to lowercase.
 * @returns         lowercased equivalent of str
 */
std::string ToLower(const std::string& str);

//!
//! \brief Returns number of seconds since the beginning of the Unix Epoch.
//! \return int64_t seconds.
//!
int64_t GetUnixEpochTime();

//!
//! \brief Formats input unix epoch time in human readable format.
//! \param int64_t seconds.
//! \return ISO8601 conformant datetime string.
//!
std::string FormatISO8601DateTime(int64_t time);

//!
//! \brief Parses an ISO8601 datetime string into Unix Epoch seconds (UTC). Accepts a 'T' or space separator,
//! optional fractional seconds (truncated), and a trailing 'Z' or +HH:MM/-HH:MM offset. A value without any zone
//! designator is taken to be UTC.
//! \param str ISO8601 datetime string, e.g. 2025-12-05T10:00:00Z or 2025-12-05T10:00:00.123456+00:00
//! \return int64_t seconds, or std::nullopt if the string cannot be parsed.
//!
std::optional<int64_t> ParseISO8601DateTime(const std::string& str);

template <typename... Args>
//!
//! \brief Creates a string with fmt specifier and variadic args.
//! \param fmt specifier
//! \param args... variadic
//! \return formatted std::string
//!
static inline std::string LogPrintStr(const char* fmt, const Args&... args)
{
    std::string log_msg;

    // Conditionally add timestamp prefix based on g_log_timestamps flag.
    if (g_log_timestamps.load(std::memory_order_relaxed)) {
        log_msg = FormatISO8601DateTime(GetUnixEpochTime()) + " ";
    }

    try {
        log_msg += tfm::format(fmt, args...);
    } catch (tinyformat::format_error& fmterr) {
        /* Original format string will have newline so don't add one here */
        log_msg += "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }

    log_msg += "\n";

    return log_msg;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout.
//! \param fmt
//! \param args
//!
void log(const char* fmt, const Args&... args)
{
    std::cout << LogPrintStr(fmt, args...);
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the debug setting.
//! \param fmt
//! \param args
//!
void debug_log(const char* fmt, const Args&... args)
{
    if (g_debug.load()) {
        log(fmt, args...);
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cerr
//! \param fmt
//! \param args
//!
void error_log(const char* fmt, const Args&... args)
{
    std::string error_fmt = "ERROR: ";
    error_fmt += fmt;

    std::cerr << LogPrintStr(error_fmt.c_str(), args...);
}

[[nodiscard]] int ParseStringToInt(const std::string& str);

//!
//! \brief Safely get an enviroment variable value from the provided name
//! \param std::string of the name of the variable to retrieve
//! \return std::string of the value of the requested variable. std::nullopt if not found.
//!
std::optional<std::string> GetEnvVariable(const std::string& var_name);

//!
//! \brief The AppLauncherException class is the base of the exception hierarchy for app_launcher.
//!
class AppLauncherException : public std::exception
{
public:
    AppLauncherException(const std::string& message) : m_message(message) {}
    AppLauncherException(const char* message) : m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

protected:
    std::string m_message;
};

//! File system related exceptions
class FileSystemException : public AppLauncherException
{
public:
    FileSystemException(const std::string& message, const std::filesystem::path& path)
        : AppLauncherException(message + " Path: " + path.string()), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//!
//! \brief Malformed or missing configuration. The app id is empty for errors that are not specific to one
//! application.
//!
class ConfigException : public AppLauncherException
{
public:
    ConfigException(const std::string& message, const std::string& app_id = std::string {})
        : AppLauncherException(app_id.empty() ? message : "App '" + app_id + "': " + message), m_app_id(app_id) {}

    const std::string& app_id() const { return m_app_id; }

private:
    std::string m_app_id;
};

//! Persistent store unreadable, unwritable, or lock timeout.
class StoreException : public AppLauncherException
{
public:
    StoreException(const std::string& message) : AppLauncherException(message) {}
};

//! A schema migration step failed. The store must not be used further in this invocation.
class MigrationException : public StoreException
{
public:
    MigrationException(const std::string& message, int to_version)
        : StoreException(message + " (migrating to schema version " + ::ToString(to_version) + ")")
        , m_to_version(to_version) {}

    int to_version() const { return m_to_version; }

private:
    int m_to_version;
};

typedef std::variant<bool, int, std::string, fs::path> config_variant;

//!
//! \brief The Config class stores program config read from the config file, with applied defaults if the
//! config file cannot be read, or a config parameter is not in the config file.
//!
class Config
{
public:
    //!
    //! \brief Constructor.
    //!
    Config();

    virtual ~Config() = default;

    //!
    //! \brief Reads and parses the config file provided by the argument and populates m_config_in, then calls private
    //! method ProcessArgs() to populate m_config. ProcessArgs() is called even if the file cannot be read, so that
    //! defaults are populated.
    //! \param config_file
    //! \return true if the config file was read.
    //!
    bool ReadAndUpdateConfig(const fs::path& config_file);

    //!
    //! \brief Provides the config_variant type value of the config parameter (argument).
    //! \param arg (key) to look up value.
    //! \return config_variant type value of the value of the config parameter (argument).
    //!
    config_variant GetArg(const std::string& arg);

    //!
    //! \brief Provides the raw key-value pairs whose key begins with the provided prefix, in key order. Repeated keys
    //! are returned in the order they appeared in the config file.
    //! \param prefix
    //! \return vector of raw key-value pairs
    //!
    std::vector<std::pair<std::string, std::string>> GetArgsWithPrefix(const std::string& prefix) const;

protected:
    //!
    //! \brief Private version of GetArg that operates on m_config_in and also selects the provided default value
    //! if the arg is not found. This is how default values for parameters are established.
    //! \param arg (key) to look up value as string.
    //! \param default_value if arg is not found.
    //! \return string value found in lookup, default value if not found.
    //!
    std::string GetArgString(const std::string& arg, const std::string& default_value) const;

    //!
    //! \brief Holds the processed parameter-values, which are strongly typed and in a config_variant union, and where
    //! default values are populated if not found in the config file (m_config_in).
    //!
    std::multimap<std::string, config_variant> m_config;

    //!
    //! \brief Holds the raw parsed parameter-values from the config file.
    //!
    std::multimap<std::string, std::string> m_config_in;

    //!
    //! \brief Values of keys for which this returns true are stored exactly as written (trimmed only), so quoting
    //! meant for a later parse survives. The default strips enclosing quotes from every value.
    //! \param key
    //!
    virtual bool KeepsQuotes(const std::string& key) const;

private:
    //!
    //! \brief Private helper method used by ReadAndUpdateConfig. Note this is pure virtual. It must be implemented
    //! in a specialization of a derived class for use by a specific application.
    //!
    virtual void ProcessArgs() = 0;

    //!
    //! \brief This is the mutex member that provides lock control for the config object. This is used to ensure the
    //! config object is thread-safe.
    //!
    mutable std::mutex mtx_config;
};

#endif // UTIL_H
