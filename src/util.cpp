#include "util.h"

#include "platform.h"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

namespace venvy {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_text_file: failed to open file: " + path.string());
  }

  std::string content;
  std::string chunk(4096, '\0');
  while (true) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    content.append(chunk.data(), n);
    if (n < chunk.size()) { break; }
  }

  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_text_file: failed to read file: " + path.string());
  }

  return content;
}

void util_write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  auto const dir{ path.has_parent_path() ? path.parent_path()
                                         : std::filesystem::path{ "." } };
  std::string pattern{ (dir / ("." + path.filename().string() + ".venvy-XXXXXX")).string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  int const fd{ ::mkstemp(path_buffer.data()) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "mkstemp failed for " + path.string());
  }

  std::filesystem::path const tmp_path{ path_buffer.data() };
  scoped_path_cleanup tmp_cleanup{ tmp_path };

  file_ptr_t file{ ::fdopen(fd, "wb") };
  if (!file) {
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err, std::generic_category(), "fdopen failed");
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "write failed: " + tmp_path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::system_error(errno, std::generic_category(), "fflush failed");
  }

  // An existing target keeps its permission bits; new files are 0644.
  mode_t mode{ S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH };
  struct stat existing{};
  if (::stat(path.c_str(), &existing) == 0) { mode = existing.st_mode & 07777; }

  if (::fchmod(::fileno(file.get()), mode) == -1) {
    throw std::system_error(errno, std::generic_category(), "fchmod failed");
  }

  if (::fsync(::fileno(file.get())) == -1) {
    throw std::system_error(errno, std::generic_category(), "fsync failed");
  }

  if (std::fclose(file.release()) != 0) {
    throw std::system_error(errno, std::generic_category(), "fclose failed");
  }

  platform::atomic_rename(tmp_path, path);
  tmp_cleanup.reset();  // renamed away; nothing left to remove
}

std::string util_join_tokens(std::vector<std::string> const &tokens) {
  std::string result;
  for (auto const &token : tokens) {
    if (!result.empty()) { result.push_back(' '); }
    result.append(token);
  }
  return result;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace venvy
