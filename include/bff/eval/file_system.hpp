// bff/eval/file_system.hpp - File access used by #include and file_exists()
#pragma once

#include <string>
#include <unordered_map>

namespace bff
{

/**
 * Read-only view of files addressed by `file://` URI.
 */
class IFileSystem
{
public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual bool file_exists(const std::string & uri) const = 0;

  /// Throws FileReadError when the file cannot be read.
  [[nodiscard]] virtual std::string read_file(const std::string & uri) const = 0;
};

/// Files on the local disk.
class DiskFileSystem : public IFileSystem
{
public:
  [[nodiscard]] bool file_exists(const std::string & uri) const override;
  [[nodiscard]] std::string read_file(const std::string & uri) const override;
};

/**
 * Files held in memory, optionally layered over another file system.
 *
 * The language server uses this to let open editor buffers shadow the
 * files on disk; tests use it on its own.
 */
class InMemoryFileSystem : public IFileSystem
{
public:
  explicit InMemoryFileSystem(const IFileSystem * fallback = nullptr) : fallback_(fallback) {}

  void set_file(const std::string & uri, std::string content);
  bool remove_file(const std::string & uri);
  [[nodiscard]] bool has_file(const std::string & uri) const;

  [[nodiscard]] bool file_exists(const std::string & uri) const override;
  [[nodiscard]] std::string read_file(const std::string & uri) const override;

private:
  std::unordered_map<std::string, std::string> files_;
  const IFileSystem * fallback_;
};

}  // namespace bff
