#pragma once
#include <string>
#include <variant>
#include <vector>

namespace crawlutil {

// "аргумент не передан" и "явный null" различаются
struct Undefined {};
struct Null {};

inline bool operator==(Undefined, Undefined) { return true; }
inline bool operator!=(Undefined, Undefined) { return false; }
inline bool operator==(Null, Null) { return true; }
inline bool operator!=(Null, Null) { return false; }

using PathValue = std::variant<Undefined, Null, std::string>;

// std::string здесь = "не массив", отдаётся как есть
using PathBatch =
    std::variant<Undefined, Null, std::string, std::vector<PathValue>>;

template <typename V> bool is_undefined(const V &v) {
  return std::holds_alternative<Undefined>(v);
}
template <typename V> bool is_null(const V &v) {
  return std::holds_alternative<Null>(v);
}

inline bool has_text(const PathValue &v) {
  return std::holds_alternative<std::string>(v);
}
inline const std::string &text_of(const PathValue &v) {
  return std::get<std::string>(v);
}

std::string to_string(const PathValue &v);

} // namespace crawlutil
