#include <crawlutil/path.hpp>

#include <algorithm>

namespace crawlutil {

std::string to_string(const PathValue &v) {
  if (is_undefined(v))
    return "undefined";
  if (is_null(v))
    return "null";
  return text_of(v);
}

std::string to_slash(std::string_view path) {
  std::string s(path);
  std::replace(s.begin(), s.end(), '\\', '/');
  return s;
}

std::string strip_parent(std::string_view path, std::string_view parent) {
  std::string p = to_slash(path);
  if (parent.empty())
    return p;
  std::string base = to_slash(parent);
  // "/foo/" и "/foo" - один и тот же родитель
  while (!base.empty() && base.back() == '/')
    base.pop_back();
  if (p.rfind(base, 0) != 0)
    return p;
  std::string rest = p.substr(base.size());
  if (!rest.empty() && rest.front() == '/')
    rest.erase(0, 1);
  return rest;
}

PathValue normalize_path(const PathValue &path) {
  if (!has_text(path))
    return path;
  return to_slash(text_of(path));
}

template <typename F>
static PathBatch map_batch(const PathBatch &paths, F &&fn) {
  const auto *items = std::get_if<std::vector<PathValue>>(&paths);
  if (!items)
    return paths;
  std::vector<PathValue> out;
  out.reserve(items->size());
  for (const auto &p : *items)
    out.push_back(fn(p));
  return out;
}

PathBatch normalize_paths(const PathBatch &paths) {
  return map_batch(paths,
                   [](const PathValue &p) { return normalize_path(p); });
}

PathValue trim_parents(const PathValue &path,
                       const std::optional<std::string> &parent) {
  if (!has_text(path) || text_of(path).empty())
    return path;
  if (!parent)
    return to_slash(text_of(path));
  return strip_parent(text_of(path), *parent);
}

PathBatch trim_all_parents(const PathBatch &paths,
                           const std::optional<std::string> &parent) {
  return map_batch(paths, [&](const PathValue &p) {
    return trim_parents(p, parent);
  });
}

} // namespace crawlutil
