/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <chrono>
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>

//!
//! \brief This to support early use of the log utility functions before the config is read to get the
//! debug flag.
//!
std::atomic<bool> g_debug = false;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when run under systemd, where the journal appends a high resolution timestamp.
//!
std::atomic<bool> g_log_timestamps = true;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.empty()) {
        return str; // No quotes to strip from an empty string.
    }

    std::string result = str; // Create a copy so we can modify it.

    if (result.front() == '"' || result.front() == '\'') {
        result.erase(0, 1); // Remove the leading quote.
    }

    if (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
        result.pop_back(); // Remove the trailing quote.
    }

    return result;
}

constexpr char ToLower(char c)
{
    return (c >= 'A' && c <= 'Z' ? (c - 'A') + 'a' : c);
}

std::string ToLower(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += ToLower((unsigned char)ch);
    return r;
}

int64_t GetUnixEpochTime()
{
    // Get the current time point
    auto now = std::chrono::system_clock::now();

    // Convert the time point to a duration since the epoch
    auto duration = now.time_since_epoch();

    // Convert the duration to seconds
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();

    return seconds;
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return strprintf("%04i-%02i-%02iT%02i:%02i:%02iZ",
                     ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

std::optional<int64_t> ParseISO8601DateTime(const std::string& str)
{
    std::string value = TrimString(str);

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char separator = 0;
    int consumed = 0;

    if (std::sscanf(value.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &month, &day, &separator, &hour, &minute, &second, &consumed) != 7) {
        return std::nullopt;
    }

    if ((separator != 'T' && separator != 't' && separator != ' ')
        || month < 1 || month > 12 || day < 1 || day > 31
        || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }

    std::string rest = value.substr(consumed);

    // Fractional seconds are truncated.
    if (!rest.empty() && rest[0] == '.') {
        size_t pos = 1;
        while (pos < rest.size() && rest[pos] >= '0' && rest[pos] <= '9') {
            ++pos;
        }

        if (pos == 1) {
            return std::nullopt;
        }

        rest = rest.substr(pos);
    }

    int64_t offset_seconds = 0;

    if (rest.empty() || rest == "Z" || rest == "z") {
        offset_seconds = 0;
    } else if (rest[0] == '+' || rest[0] == '-') {
        std::string digits = rest.substr(1);
        digits.erase(std::remove(digits.begin(), digits.end(), ':'), digits.end());

        if (digits.size() != 4 || digits.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }

        int offset_hours = std::stoi(digits.substr(0, 2));
        int offset_minutes = std::stoi(digits.substr(2, 2));

        if (offset_hours > 23 || offset_minutes > 59) {
            return std::nullopt;
        }

        offset_seconds = (offset_hours * 3600 + offset_minutes * 60) * (rest[0] == '-' ? -1 : 1);
    } else {
        return std::nullopt;
    }

    struct tm ts {};
    ts.tm_year = year - 1900;
    ts.tm_mon = month - 1;
    ts.tm_mday = day;
    ts.tm_hour = hour;
    ts.tm_min = minute;
    // A leap second is counted as the following second.
    ts.tm_sec = second == 60 ? 59 : second;

    time_t utc_time = timegm(&ts);

    // timegm normalizes out-of-range fields, so an impossible date such as Feb 31 comes back as a different day.
    struct tm check {};
    if (gmtime_r(&utc_time, &check) == nullptr
        || check.tm_year != ts.tm_year || check.tm_mon != month - 1 || check.tm_mday != day) {
        return std::nullopt;
    }

    return static_cast<int64_t>(utc_time) + (second == 60 ? 1 : 0) - offset_seconds;
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string(value);
}

// Class Config

Config::Config()
{}

bool Config::ReadAndUpdateConfig(const fs::path& config_file) {
    std::unique_lock<std::mutex> lock(mtx_config);

    std::multimap<std::string, std::string> config;
    bool file_read = false;

    std::ifstream file(config_file);

    if (!file.is_open()) {
        error_log("%s: Could not open the config file: %s",
                  __func__,
                  config_file);
    } else {
        std::string line;
        while (std::getline(file, line)) {
            line = TrimString(line);

            // Skip empty lines and lines starting with '#'
            if (line.empty() || line[0] == '#') {
                continue;
            }

            // Split at the first '=' only. Command lines are allowed to contain '='.
            size_t equals_pos = line.find('=');

            if (equals_pos == std::string::npos) {
                debug_log("WARNING: %s: Skipping malformed config line: %s",
                          __func__,
                          line);
                continue;
            }

            std::string key = StripQuotes(TrimString(line.substr(0, equals_pos)));
            std::string value = TrimString(line.substr(equals_pos + 1));

            if (!KeepsQuotes(key)) {
                value = StripQuotes(value);
            }

            config.insert(std::make_pair(key, value));
        }

        file.close();
        file_read = true;
    }

    // Do this all at once so the result of the config read is essentially "atomic".
    m_config_in.swap(config);
    m_config.clear();

    // If the config file read failed, we will process args anyway, which will result in defaults being chosen.
    ProcessArgs();

    return file_read;
}

config_variant Config::GetArg(const std::string& arg)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

bool Config::KeepsQuotes(const std::string& /* key */) const
{
    return false;
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

std::vector<std::pair<std::string, std::string>> Config::GetArgsWithPrefix(const std::string& prefix) const
{
    std::unique_lock<std::mutex> lock(mtx_config);

    std::vector<std::pair<std::string, std::string>> args;

    for (auto iter = m_config_in.lower_bound(prefix); iter != m_config_in.end(); ++iter) {
        if (iter->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }

        args.push_back(*iter);
    }

    return args;
}
