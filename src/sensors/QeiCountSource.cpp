#include "sensors/QeiCountSource.h"

/*
===============================================================================
  QeiCountSource.cpp
===============================================================================

  Encoder::read() briefly masks interrupts to copy the 32-bit count, so the
  snapshot is never torn. Truncation to uint16_t is modulo 2^16, so
  orientCount() can be applied after truncating.
===============================================================================
*/

QeiCountSource::QeiCountSource(uint8_t pin_a, uint8_t pin_b, bool invert_direction)
: _enc(pin_a, pin_b),
  _invert_direction(invert_direction)
{
}

void QeiCountSource::begin() {
  _enc.write(0);
}

uint16_t QeiCountSource::currentCount() {
  return orientCount((uint16_t)_enc.read(), _invert_direction);
}
