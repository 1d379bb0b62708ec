// bff/eval/file_system.cpp - File access used by #include and file_exists()
#include "bff/eval/file_system.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "bff/basic/uri.hpp"
#include "bff/eval/errors.hpp"

namespace bff
{

namespace fs = std::filesystem;

bool DiskFileSystem::file_exists(const std::string & uri) const
{
  const auto path = file_uri_to_path(uri);
  if (!path) {
    return false;
  }
  std::error_code ec;
  return fs::is_regular_file(*path, ec);
}

std::string DiskFileSystem::read_file(const std::string & uri) const
{
  const auto path = file_uri_to_path(uri);
  if (!path) {
    throw FileReadError(uri, "not a file URI: " + uri);
  }
  std::error_code ec;
  if (fs::is_directory(*path, ec)) {
    throw FileReadError(uri, "is a directory: " + *path);
  }
  std::ifstream ifs(*path, std::ios::in | std::ios::binary);  // NOLINT(misc-const-correctness)
  if (!ifs) {
    throw FileReadError(uri, "cannot open file: " + *path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

void InMemoryFileSystem::set_file(const std::string & uri, std::string content)
{
  files_[uri] = std::move(content);
}

bool InMemoryFileSystem::remove_file(const std::string & uri) { return files_.erase(uri) > 0; }

bool InMemoryFileSystem::has_file(const std::string & uri) const
{
  return files_.find(uri) != files_.end();
}

bool InMemoryFileSystem::file_exists(const std::string & uri) const
{
  if (has_file(uri)) {
    return true;
  }
  return fallback_ != nullptr && fallback_->file_exists(uri);
}

std::string InMemoryFileSystem::read_file(const std::string & uri) const
{
  const auto it = files_.find(uri);
  if (it != files_.end()) {
    return it->second;
  }
  if (fallback_ != nullptr) {
    return fallback_->read_file(uri);
  }
  throw FileReadError(uri, "no such file: " + uri);
}

}  // namespace bff
