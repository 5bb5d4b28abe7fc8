#pragma once
#include <stddef.h>
#include <stdint.h>

#include "Params.h"

/*
  DisplayFormat

  Line layout for MeterDisplay: a right-aligned value, a space and a short
  unit ("r" or "cn"). Values are pinned to +/-DISPLAY_VALUE_LIMIT before
  formatting so the widest value is known up front.
*/

namespace display_format {

constexpr uint8_t VALUE_WIDTH = 10;

// "-999999.999"
constexpr size_t VALUE_MAX_CHARS = 11;

constexpr size_t UNIT_MAX_CHARS = 2;

// value + ' ' + unit + '\0'
constexpr size_t LINE_BUF_BYTES = 20;

static_assert(VALUE_MAX_CHARS + 1 + UNIT_MAX_CHARS + 1 <= LINE_BUF_BYTES,
              "display line buffer too small");

// NAN passes through (printed as "nan")
inline double clampValue(double value) {
  if (value > DISPLAY_VALUE_LIMIT) return DISPLAY_VALUE_LIMIT;
  if (value < -DISPLAY_VALUE_LIMIT) return -DISPLAY_VALUE_LIMIT;
  return value;
}

}  // namespace display_format
