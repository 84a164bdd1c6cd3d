#include "path_resolver.hpp"

#include "platform/utf8_path.hpp"

#include <algorithm>
#include <cctype>

namespace sfxpack::paths {

using archive::ArchiveError;
using archive::ErrorKind;
using archive::fail;

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

const char* home_variable() {
#if defined(_WIN32)
    return "USERPROFILE";
#else
    return "HOME";
#endif
}

bool lookup(const EnvLookup& env, std::string_view name, std::string& out, ArchiveError* outError) {
    std::optional<std::string> value = env ? env(name) : std::nullopt;
    if (!value) {
        return fail(outError, ErrorKind::PathResolution,
                    "environment variable '" + std::string(name) + "' is not set");
    }
    out += *value;
    return true;
}

} // namespace

EnvLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        return platform::utf8_getenv(name);
    };
}

bool expand_placeholders(std::string_view spec,
                         const EnvLookup& env,
                         std::string* out,
                         ArchiveError* outError) {
    std::string result;
    result.reserve(spec.size());

    std::size_t i = 0;

    if (!spec.empty() && spec[0] == '~' && (spec.size() == 1 || is_separator(spec[1]))) {
        if (!lookup(env, home_variable(), result, outError)) {
            return false;
        }
        i = 1;
    }

    while (i < spec.size()) {
        const char c = spec[i];

        if (c == '%') {
            const std::size_t close = spec.find('%', i + 1);
            if (close == std::string_view::npos) {
                // Unclosed: literal text.
                result += '%';
                ++i;
                continue;
            }
            if (close == i + 1) {
                result += '%';  // %%
                i = close + 1;
                continue;
            }
            if (!lookup(env, spec.substr(i + 1, close - i - 1), result, outError)) {
                return false;
            }
            i = close + 1;
            continue;
        }

        if (c == '$' && i + 1 < spec.size()) {
            const char next = spec[i + 1];

            if (next == '$') {
                result += '$';
                i += 2;
                continue;
            }

            if (next == '{') {
                const std::size_t close = spec.find('}', i + 2);
                if (close == std::string_view::npos || close == i + 2) {
                    result += '$';
                    ++i;
                    continue;
                }
                if (!lookup(env, spec.substr(i + 2, close - i - 2), result, outError)) {
                    return false;
                }
                i = close + 1;
                continue;
            }

            if (is_name_start(next)) {
                std::size_t end = i + 1;
                while (end < spec.size() && is_name_char(spec[end])) {
                    ++end;
                }
                if (!lookup(env, spec.substr(i + 1, end - i - 1), result, outError)) {
                    return false;
                }
                i = end;
                continue;
            }
        }

        result += c;
        ++i;
    }

    *out = std::move(result);
    return true;
}

bool resolve_extraction_path(std::string_view spec,
                             const std::filesystem::path& executableDir,
                             const EnvLookup& env,
                             std::filesystem::path* out,
                             ArchiveError* outError) {
    if (spec.empty()) {
        return fail(outError, ErrorKind::PathResolution, "extraction path spec is empty");
    }

    std::string expanded;
    if (!expand_placeholders(spec, env, &expanded, outError)) {
        return false;
    }

    if (expanded.empty()) {
        return fail(outError, ErrorKind::PathResolution,
                    "extraction path spec '" + std::string(spec) + "' expands to an empty path");
    }

#if !defined(_WIN32)
    std::replace(expanded.begin(), expanded.end(), '\\', '/');
#endif

    std::filesystem::path result = platform::path_from_utf8(expanded);
    if (!result.is_absolute()) {
        result = executableDir / result;
    }
    result = result.lexically_normal();

    // "dir/" normalizes to "dir/"; drop the empty trailing component.
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path();
    }

    *out = std::move(result);
    return true;
}

} // namespace sfxpack::paths
