#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ur::utils
{

std::optional<std::filesystem::path> executable_path();

// Per-user directory holding the instance lock and forwarding socket.
std::filesystem::path runtime_root();

// Resolves a bare program name against extra_dirs (in order) and then PATH.
// Names with a directory component are returned untouched.
std::optional<std::filesystem::path>
find_executable(std::string const &name,
                std::vector<std::string> const &extra_dirs);

std::optional<std::string> read_env(char const *key);

unsigned long current_process_id() noexcept;

} // namespace ur::utils
