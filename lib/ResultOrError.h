#ifndef LEDGERFS_RESULT_OR_ERROR_H
#define LEDGERFS_RESULT_OR_ERROR_H

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace lfs {

/**
 * Common base for error types carried by ResultOrError.
 * Components derive their own Error from it and publish E_* code constants.
 */
struct RoeErrorBase {
  int32_t code{ -1 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : message(std::move(msg)) {}
};

inline std::ostream &operator<<(std::ostream &os, const RoeErrorBase &err) {
  return os << "[" << err.code << "] " << err.message;
}

/**
 * Holds either a value of type T or an error of type E.
 *
 * Both sides convert implicitly, so functions can simply
 * `return value;` or `return Error(code, "message");`.
 */
template <typename T, typename E = RoeErrorBase> class ResultOrError {
  static_assert(!std::is_same<T, E>::value,
                "value and error types must differ");

public:
  ResultOrError(const T &value) : storage_(std::in_place_index<0>, value) {}
  ResultOrError(T &&value) : storage_(std::in_place_index<0>, std::move(value)) {}

  ResultOrError(const E &err) : storage_(std::in_place_index<1>, err) {}
  ResultOrError(E &&err) : storage_(std::in_place_index<1>, std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  bool isOk() const { return storage_.index() == 0; }
  bool isError() const { return storage_.index() == 1; }
  explicit operator bool() const { return isOk(); }

  const T &value() const {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return std::get<0>(storage_);
  }

  T &value() {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return std::get<0>(storage_);
  }

  T valueOr(const T &defaultValue) const {
    return isOk() ? std::get<0>(storage_) : defaultValue;
  }

  const E &error() const {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(storage_);
  }

  E &error() {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(storage_);
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }

  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  std::variant<T, E> storage_;
};

// Specialization for operations that only report success or failure
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() = default;

  ResultOrError(const E &err) : hasValue_(false), error_(err) {}
  ResultOrError(E &&err) : hasValue_(false), error_(std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

private:
  bool hasValue_{ true };
  E error_{};
};

} // namespace lfs

#endif // LEDGERFS_RESULT_OR_ERROR_H
