/**
 * @file text_parse.hpp
 * @brief Мелкие помощники разбора текстовых файлов и IPC-команд
 */

#pragma once

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glasskey {

/// Удаляет пробелы с начала и конца строки
[[nodiscard]] inline std::string_view trim(std::string_view sv) noexcept {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Парсит целое число из строки
[[nodiscard]] inline std::optional<int> parse_int(std::string_view sv) {
  sv = trim(sv);
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит число с плавающей точкой из строки
[[nodiscard]] inline std::optional<double> parse_double(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty()) {
    return std::nullopt;
  }
  // std::from_chars для double не везде поддерживается, используем strtod
  std::string str{sv};
  char *end = nullptr;
  double value = std::strtod(str.c_str(), &end);
  if (end == str.c_str() + str.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
[[nodiscard]] inline std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Делит строку по пробельным символам
[[nodiscard]] inline std::vector<std::string_view>
split_ws(std::string_view sv) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) {
      ++i;
    }
    const std::size_t start = i;
    while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) {
      ++i;
    }
    if (i > start) {
      out.push_back(sv.substr(start, i - start));
    }
  }
  return out;
}

} // namespace glasskey
