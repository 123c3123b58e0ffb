#pragma once
#include "serve_guard/http_error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sg {

enum class PathError { None, Malformed, Forbidden };

struct PathResult {
  bool ok = false;
  std::string path;        // normalized root/relative when ok
  PathError error = PathError::None;
  HttpError http;          // 400 Malformed Path | 403 Forbidden when !ok
};

// Resolve an untrusted relative path against a trusted root without touching
// the filesystem. Rejects missing, NUL-carrying and absolute input (400) and
// anything that climbs above the root once normalized (403).
PathResult resolve_path(std::string_view root,
                        std::optional<std::string_view> relative);

// Same, with root ".".
PathResult resolve_path(std::optional<std::string_view> relative);

// Collapse "." / ".." segments and separator runs (lexical only).
std::string normalize_path(std::string_view p);

}
