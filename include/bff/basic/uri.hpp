// bff/basic/uri.hpp - file:// URI helpers
//
// BFF files are identified by `file://` URIs throughout the evaluator. These
// helpers convert between URIs and local paths and do the directory
// arithmetic needed by #include, file_exists() and _CURRENT_BFF_DIR_.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bff
{

/// Percent-decode a URI component.
[[nodiscard]] std::string url_decode(std::string_view s);

/// `file:///a/b.bff` -> `/a/b.bff`. Returns nullopt for non-file URIs.
[[nodiscard]] std::optional<std::string> file_uri_to_path(std::string_view uri);

/// `/a/b.bff` -> `file:///a/b.bff`. Spaces and `%` are percent-encoded.
[[nodiscard]] std::string path_to_file_uri(std::string_view path);

/// True for `/x`, `\x` and drive-letter paths such as `C:\x` or `C:/x`.
[[nodiscard]] bool is_absolute_path(std::string_view path);

/// URI of the directory containing `uri`, with a trailing slash.
[[nodiscard]] std::string uri_dirname(std::string_view uri);

/**
 * Resolve `path` against a directory URI.
 *
 * Absolute paths are converted directly; relative ones are joined to
 * `base_dir_uri` and normalised (`.` and `..` segments removed). Backslashes
 * are treated as separators.
 */
[[nodiscard]] std::string resolve_uri(std::string_view base_dir_uri, std::string_view path);

/**
 * Path of `to_dir_uri` relative to `from_dir_uri`, using `/` separators.
 *
 * Returns an empty string when both are the same directory.
 */
[[nodiscard]] std::string relative_path(std::string_view from_dir_uri, std::string_view to_dir_uri);

}  // namespace bff
