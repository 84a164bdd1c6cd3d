#pragma once

#include "../archive/errors.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sfxpack::paths {

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Lookup backed by the running process's environment.
EnvLookup process_environment();

// Expands placeholders in `spec`:
//   %NAME%   ${NAME}   $NAME
// `%%` and `$$` are literal. A `%` without a closing `%`, or a `$` not
// followed by a name, is kept as text. A leading `~` becomes HOME.
// Fails with PathResolution naming the first unset variable.
bool expand_placeholders(std::string_view spec,
                         const EnvLookup& env,
                         std::string* out,
                         archive::ArchiveError* outError);

// Expands `spec` and anchors it: absolute results are used as-is, relative
// ones are joined to `executableDir`. The result is lexically normalized.
// On POSIX hosts '\\' in the expanded text is a directory separator.
bool resolve_extraction_path(std::string_view spec,
                             const std::filesystem::path& executableDir,
                             const EnvLookup& env,
                             std::filesystem::path* out,
                             archive::ArchiveError* outError);

} // namespace sfxpack::paths
