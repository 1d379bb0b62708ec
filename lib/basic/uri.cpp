// bff/basic/uri.cpp - file:// URI helpers
#include "bff/basic/uri.hpp"

#include <cctype>
#include <vector>

namespace bff
{
namespace
{

constexpr std::string_view k_file_scheme = "file://";

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool is_drive_letter_path(std::string_view p)
{
  return p.size() >= 2 && (std::isalpha(static_cast<unsigned char>(p[0])) != 0) && p[1] == ':';
}

std::vector<std::string> split_segments(std::string_view path)
{
  std::vector<std::string> segments;
  std::string current;
  for (const char c : path) {
    if (c == '/' || c == '\\') {
      segments.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  segments.push_back(std::move(current));
  return segments;
}

// Drops empty and "." segments and folds "..". The first segment is kept as is
// so that a leading empty segment (absolute path) or a drive letter survives.
std::string normalize_path(std::string_view path)
{
  const auto segments = split_segments(path);
  std::vector<std::string> out;
  for (size_t i = 0; i < segments.size(); ++i) {
    const auto & seg = segments[i];
    if (i == 0) {
      out.push_back(seg);
      continue;
    }
    if (seg.empty() || seg == ".") {
      continue;
    }
    if (seg == "..") {
      if (out.size() > 1) {
        out.pop_back();
      }
      continue;
    }
    out.push_back(seg);
  }

  std::string joined;
  for (size_t i = 0; i < out.size(); ++i) {
    if (i > 0) joined.push_back('/');
    joined += out[i];
  }
  if (out.size() == 1 && out[0].empty()) {
    joined = "/";
  }
  // Keep a trailing separator for directory paths.
  if (!path.empty() && (path.back() == '/' || path.back() == '\\') && joined.back() != '/') {
    joined.push_back('/');
  }
  return joined;
}

std::string encode_path(std::string_view path)
{
  static constexpr char k_hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(path.size());
  for (const char c : path) {
    if (c == ' ' || c == '%' || c == '#' || c == '?') {
      const auto u = static_cast<unsigned char>(c);
      out.push_back('%');
      out.push_back(k_hex[u >> 4]);
      out.push_back(k_hex[u & 0x0F]);
    } else if (c == '\\') {
      out.push_back('/');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

std::optional<std::string> file_uri_to_path(std::string_view uri)
{
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (starts_with(rest, "//")) {
    // file://hostname/path is not supported.
    return std::nullopt;
  }

  std::string path = url_decode(rest);
  // file:///C:/x -> C:/x
  if (path.size() >= 3 && path[0] == '/' && is_drive_letter_path(std::string_view(path).substr(1))) {
    path.erase(0, 1);
  }
  return path;
}

std::string path_to_file_uri(std::string_view path)
{
  const std::string normalized = normalize_path(path);
  if (is_drive_letter_path(normalized)) {
    return std::string(k_file_scheme) + "/" + encode_path(normalized);
  }
  if (!normalized.empty() && normalized[0] == '/') {
    return std::string(k_file_scheme) + encode_path(normalized);
  }
  return std::string(k_file_scheme) + "/" + encode_path(normalized);
}

bool is_absolute_path(std::string_view path)
{
  if (path.empty()) {
    return false;
  }
  if (path[0] == '/' || path[0] == '\\') {
    return true;
  }
  return is_drive_letter_path(path) && path.size() >= 3 && (path[2] == '/' || path[2] == '\\');
}

std::string uri_dirname(std::string_view uri)
{
  const auto pos = uri.find_last_of('/');
  if (pos == std::string_view::npos) {
    return std::string(uri);
  }
  return std::string(uri.substr(0, pos + 1));
}

std::string resolve_uri(std::string_view base_dir_uri, std::string_view path)
{
  if (is_absolute_path(path)) {
    return path_to_file_uri(path);
  }

  std::string_view base = base_dir_uri;
  if (starts_with(base, k_file_scheme)) {
    base = base.substr(k_file_scheme.size());
  }

  std::string joined(base);
  if (joined.empty() || joined.back() != '/') {
    joined.push_back('/');
  }
  joined += encode_path(path);
  return std::string(k_file_scheme) + normalize_path(joined);
}

std::string relative_path(std::string_view from_dir_uri, std::string_view to_dir_uri)
{
  auto trim = [](std::string_view s) {
    if (starts_with(s, k_file_scheme)) {
      s = s.substr(k_file_scheme.size());
    }
    while (!s.empty() && s.back() == '/') {
      s.remove_suffix(1);
    }
    return s;
  };

  const auto from = split_segments(trim(from_dir_uri));
  const auto to = split_segments(trim(to_dir_uri));

  size_t common = 0;
  while (common < from.size() && common < to.size() && from[common] == to[common]) {
    ++common;
  }

  std::string result;
  for (size_t i = common; i < from.size(); ++i) {
    if (!result.empty()) result.push_back('/');
    result += "..";
  }
  for (size_t i = common; i < to.size(); ++i) {
    if (!result.empty()) result.push_back('/');
    result += url_decode(to[i]);
  }
  return result;
}

}  // namespace bff
