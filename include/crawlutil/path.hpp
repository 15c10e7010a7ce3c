#pragma once
#include "value.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace crawlutil {

// '\\' -> '/'
std::string to_slash(std::string_view path);
// prefix match после to_slash обоих аргументов, хвостовые '/' у parent не учитываются;
// пустой parent -> to_slash(path)
std::string strip_parent(std::string_view path, std::string_view parent);

PathValue normalize_path(const PathValue &path = Undefined{});
PathBatch normalize_paths(const PathBatch &paths = Undefined{});

PathValue trim_parents(const PathValue &path,
                       const std::optional<std::string> &parent = std::nullopt);
PathBatch trim_all_parents(const PathBatch &paths,
                           const std::optional<std::string> &parent);

} // namespace crawlutil
