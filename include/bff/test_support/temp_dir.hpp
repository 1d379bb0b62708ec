// bff/test_support/temp_dir.hpp - Scratch directory for tests that need a disk
#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace bff::test_support
{

/// Directory under the system temp dir, removed with its contents on destruction.
struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / ("bff_test_" + name))
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Writes `content` to `relative`, creating parent directories.
  std::filesystem::path write(const std::string & relative, const std::string & content) const
  {
    const std::filesystem::path file = path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }
};

}  // namespace bff::test_support
