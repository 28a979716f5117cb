#if defined(_WIN32)
#error "platform_posix.cpp should not be compiled on Windows builds"
#else

#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace venvy::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

std::filesystem::path get_exe_path() {
#ifdef __APPLE__
  uint32_t size{ 0 };
  _NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size);
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    throw std::runtime_error("_NSGetExecutablePath failed");
  }
  return std::filesystem::canonical(buf.data());
#else
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
#endif
}

std::optional<std::filesystem::path> find_executable(std::string_view name) {
  if (name.empty() || name.find('/') != std::string_view::npos) { return std::nullopt; }

  auto const path_env{ env_var_get("PATH") };
  if (!path_env) { return std::nullopt; }

  for (std::string_view sv{ *path_env }; !sv.empty();) {
    auto const pos{ sv.find(':') };
    auto const entry{ sv.substr(0, pos) };
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);

    // POSIX: an empty PATH entry means the current directory
    std::filesystem::path const candidate{
      (entry.empty() ? std::filesystem::path{ "." } : std::filesystem::path{ entry }) /
      name
    };

    struct stat st{};
    if (::stat(candidate.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) { continue; }
    if (::access(candidate.c_str(), X_OK) != 0) { continue; }
    return candidate;
  }

  return std::nullopt;
}

std::optional<std::string> env_var_get(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_get: null name"); }
  char const *value{ std::getenv(name) };
  if (!value || *value == '\0') { return std::nullopt; }
  return std::string{ value };
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

}  // namespace venvy::platform

#endif  // POSIX implementation
