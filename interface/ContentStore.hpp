#pragma once

#include "../lib/ResultOrError.h"

#include <cstdint>
#include <string>

namespace lfs {
namespace iii {

/**
 * Interface for a content-addressable blob store.
 * Addresses are opaque strings issued by the store on put().
 */
class ContentStore {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_UNAVAILABLE = 1; // Backend unreachable
  constexpr static int32_t E_TIMEOUT = 2;     // Backend did not answer in time
  constexpr static int32_t E_NOT_FOUND = 3;   // No content at address
  constexpr static int32_t E_IO = 4;          // Local read/write failure
  constexpr static int32_t E_PROTOCOL = 5;    // Unexpected backend response

  virtual ~ContentStore() = default;

  /**
   * Store bytes
   * @return Address to pass to get()
   */
  virtual Roe<std::string> put(const std::string &data) = 0;

  /**
   * Fetch the bytes stored under address
   */
  virtual Roe<std::string> get(const std::string &address) = 0;

  // Connectivity probe
  virtual bool isAvailable() = 0;

  // Transient errors are worth another attempt
  static bool isTransient(int32_t code) {
    return code == E_UNAVAILABLE || code == E_TIMEOUT || code == E_IO;
  }
};

} // namespace iii
} // namespace lfs
