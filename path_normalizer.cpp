/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <algorithm>

#include <path_normalizer.h>

namespace {

bool IsVariableNameChar(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

} // anonymous namespace

namespace AppLauncher {

std::string ExpandEnvironmentVariables(const std::string& expression, const Platform& platform)
{
    std::string out;
    size_t pos = 0;

    while (pos < expression.size()) {
        char c = expression[pos];

        if (c == '$' && pos + 1 < expression.size()) {
            // ${NAME}
            if (expression[pos + 1] == '{') {
                size_t close = expression.find('}', pos + 2);

                if (close != std::string::npos && close > pos + 2) {
                    std::string name = expression.substr(pos + 2, close - pos - 2);
                    std::optional<std::string> value = platform.GetEnv(name);

                    if (value) {
                        out += *value;
                        pos = close + 1;
                        continue;
                    }
                }

                out += c;
                ++pos;
                continue;
            }

            // $NAME
            size_t end = pos + 1;
            while (end < expression.size() && IsVariableNameChar(expression[end])) {
                ++end;
            }

            if (end > pos + 1) {
                std::optional<std::string> value = platform.GetEnv(expression.substr(pos + 1, end - pos - 1));

                if (value) {
                    out += *value;
                    pos = end;
                    continue;
                }
            }

            out += c;
            ++pos;
            continue;
        }

        // %NAME%
        if (c == '%') {
            size_t close = expression.find('%', pos + 1);

            if (close != std::string::npos && close > pos + 1) {
                std::string name = expression.substr(pos + 1, close - pos - 1);

                if (std::all_of(name.begin(), name.end(), IsVariableNameChar)) {
                    std::optional<std::string> value = platform.GetEnv(name);

                    if (value) {
                        out += *value;
                        pos = close + 1;
                        continue;
                    }
                }
            }
        }

        out += c;
        ++pos;
    }

    return out;
}

std::string ExpandHomeDirectory(const std::string& expression, const Platform& platform)
{
    if (expression.empty() || expression[0] != '~') {
        return expression;
    }

    if (expression.size() > 1 && expression[1] != '/') {
        // ~user forms are not expanded.
        return expression;
    }

    std::optional<fs::path> home = platform.GetHomeDirectory();

    if (!home) {
        log("WARNING: %s: Home directory unknown; leaving %s unexpanded.",
            __func__,
            expression);

        return expression;
    }

    return home->string() + expression.substr(1);
}

fs::path NormalizePath(const std::string& expression, const Platform& platform)
{
    std::string expanded = ExpandHomeDirectory(ExpandEnvironmentVariables(TrimString(expression), platform), platform);

    if (expanded.empty()) {
        return fs::path {};
    }

    fs::path candidate(expanded);
    std::error_code ec;

    fs::path absolute_path = fs::absolute(candidate, ec);

    if (ec) {
        debug_log("WARNING: %s: Unable to make %s absolute: %s",
                  __func__,
                  candidate,
                  ec.message());

        absolute_path = candidate;
    }

    absolute_path = absolute_path.lexically_normal();

    // Drop a trailing separator, but never reduce the root itself.
    if (!absolute_path.has_filename() && absolute_path.has_relative_path()) {
        absolute_path = absolute_path.parent_path();
    }

    if (!absolute_path.has_relative_path()) {
        return absolute_path;
    }

    // Only the parent chain is canonicalized. The final component is kept as is so that a symlink target stays a link.
    fs::path canonical_parent = fs::weakly_canonical(absolute_path.parent_path(), ec);

    if (ec || canonical_parent.empty()) {
        debug_log("WARNING: %s: Canonicalization of %s failed, using expanded form: %s",
                  __func__,
                  absolute_path,
                  ec.message());

        return absolute_path;
    }

    return canonical_parent / absolute_path.filename();
}

std::vector<fs::path> NormalizePaths(const std::vector<std::string>& expressions, const Platform& platform)
{
    std::vector<fs::path> paths;

    for (const auto& expression : expressions) {
        paths.push_back(NormalizePath(expression, platform));
    }

    return paths;
}

} // namespace AppLauncher
