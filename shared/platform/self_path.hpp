#pragma once

#include <filesystem>
#include <string>

namespace sfxpack::platform {

// Absolute path of the running executable's on-disk image.
// Returns false and fills outError when the OS does not report it.
bool executable_path(std::filesystem::path* out, std::string* outError);

} // namespace sfxpack::platform
