#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace venvy::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

std::filesystem::path get_exe_path();

// Search each PATH entry for an executable regular file named `name`.
std::optional<std::filesystem::path> find_executable(std::string_view name);

// Returns nullopt when unset or set to the empty string.
std::optional<std::string> env_var_get(char const *name);
void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);

}  // namespace venvy::platform
