#pragma once
#include <stdint.h>

/*
  CountSource

  Purpose:
  The one thing the meter needs from hardware: a snapshot of a 16-bit
  quadrature counter that wraps modulo 2^16.

  Read exactly once per tick. Real hardware: QeiCountSource. Tests use a
  scripted source.
*/

class CountSource {
public:
  virtual ~CountSource() {}

  virtual uint16_t currentCount() = 0;
};

// Map a raw counter snapshot to the meter's direction. Negation is modulo
// 2^16 like the counter itself, so the meter sees a mirrored circle.
inline uint16_t orientCount(uint16_t raw, bool invert) {
  return invert ? (uint16_t)(0u - raw) : raw;
}
