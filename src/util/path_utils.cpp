#include "serve_guard/path_utils.hpp"
#include <filesystem>
#include <string>

namespace sg {

namespace fs = std::filesystem;

static PathResult fail(PathError why, HttpError http) {
  PathResult r;
  r.error = why;
  r.http = std::move(http);
  return r;
}

static bool climbs_above(const fs::path& normalized) {
  for (const auto& part : normalized) {
    if (part == "..") return true;
  }
  return false;
}

static bool ends_with_separator(const std::string& p) {
  return !p.empty() && (p.back() == '/' || p.back() == static_cast<char>(fs::path::preferred_separator));
}

std::string normalize_path(std::string_view p) {
  return fs::path(std::string(p)).lexically_normal().string();
}

PathResult resolve_path(std::optional<std::string_view> relative) {
  return resolve_path(".", relative);
}

PathResult resolve_path(std::string_view root,
                        std::optional<std::string_view> relative) {
  if (!relative) return fail(PathError::Malformed, make_http_error(400, "Malformed Path"));

  // NUL bytes are malicious whatever their origin
  const std::string rel(*relative);
  if (rel.find('\0') != std::string::npos)
    return fail(PathError::Malformed, make_http_error(400, "Malformed Path"));

  const fs::path rel_path(rel);
  if (rel_path.is_absolute() || rel_path.has_root_name() || rel_path.has_root_directory())
    return fail(PathError::Malformed, make_http_error(400, "Malformed Path"));

  // Decide on the attacker-controlled part alone, anchored at a synthetic root.
  if (climbs_above((fs::path(".") / rel_path).lexically_normal()))
    return fail(PathError::Forbidden, make_http_error(403));

  const fs::path base(std::string{root});
  const fs::path joined = rel.empty() ? base : base / rel_path;

  fs::path out = joined.lexically_normal();
  // a trailing "." or ".." segment leaves "dir/"; only keep the slash if the input had one
  if (!rel.empty() && !ends_with_separator(rel) && !out.has_filename() && out.has_relative_path())
    out = out.parent_path();

  PathResult r;
  r.ok = true;
  r.path = out.string();
  return r;
}

}
