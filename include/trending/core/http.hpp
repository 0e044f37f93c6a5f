#pragma once

#include "glaze/core/opts.hpp"
#include <cstdint>

namespace trending::core {

inline constexpr auto JsonOpts = glz::opts{.error_on_missing_keys = true};
inline constexpr auto LenientJsonOpts = glz::opts{.error_on_unknown_keys = false};

enum class HttpStatus : uint16_t {
  // 2xx Success
  Ok = 200,
  Accepted = 202,

  // 4xx Client Errors
  BadRequest = 400,
};

inline constexpr bool isSuccess(int StatusCode) {
  return StatusCode >= 200 && StatusCode < 300;
}

} // namespace trending::core
