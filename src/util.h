#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace venvy {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file as text.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_text_file(std::filesystem::path const &path);

// Write content to a temporary sibling of `path`, fsync it, then rename it over `path`.
// Readers observe either the previous file or the complete new one, never a partial
// write. The temporary is removed if any step fails. A file that already exists keeps
// its permission bits; a new one is created 0644.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view content);

// Join argv tokens with spaces for log and error messages. Not a shell quoting.
std::string util_join_tokens(std::vector<std::string> const &tokens);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace venvy
