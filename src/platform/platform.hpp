#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Expands a leading "~/" to the home directory.
std::filesystem::path expand_home(const std::string& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
