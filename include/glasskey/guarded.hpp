/**
 * @file guarded.hpp
 * @brief Значение под мьютексом с атомарными get/set/compute
 *
 * Сам мьютекс наружу не выдаётся; читатели получают копию.
 */

#pragma once

#include <mutex>
#include <type_traits>
#include <utility>

namespace glasskey {

template <class T> class Guarded {
public:
  Guarded() = default;
  explicit Guarded(T value) : value_(std::move(value)) {}

  Guarded(const Guarded &) = delete;
  Guarded &operator=(const Guarded &) = delete;

  [[nodiscard]] T get() const {
    std::lock_guard<std::mutex> lock(mu_);
    return value_;
  }

  void set(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    value_ = std::move(value);
  }

  /// Выполняет fn над значением под замком (fn не должна блокироваться)
  template <class F> auto compute(F &&fn) -> std::invoke_result_t<F, T &> {
    std::lock_guard<std::mutex> lock(mu_);
    return std::forward<F>(fn)(value_);
  }

private:
  mutable std::mutex mu_;
  T value_{};
};

} // namespace glasskey
