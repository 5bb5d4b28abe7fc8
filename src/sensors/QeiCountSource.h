#pragma once
#include <Arduino.h>
#include <Encoder.h>  // Paul Stoffregen Encoder library

#include "meter/CountSource.h"

/*
===============================================================================
  QeiCountSource.h
===============================================================================

  PURPOSE
  -------
  Hardware CountSource. The Encoder library decodes A/B edges in interrupts
  into a signed 32-bit count; this wrapper hands the meter the low 16 bits,
  i.e. exactly what a 16-bit timer in encoder mode would hold.

  USAGE
  -----
  - Call begin() once in setup()
  - TurnsMeter::tick() calls currentCount() once per tick

  IMPORTANT
  ---------
  The snapshot wraps modulo 2^16 in both directions. The 64-bit position is
  rebuilt by WraparoundCounter, not here.
===============================================================================
*/

class QeiCountSource : public CountSource {
public:
  /*
    pin_a / pin_b:
      Quadrature encoder channels A and B

    invert_direction:
      Set true if clockwise winding reads as negative count
  */
  QeiCountSource(uint8_t pin_a, uint8_t pin_b, bool invert_direction = false);

  void begin();

  uint16_t currentCount() override;

private:
  Encoder _enc;
  bool _invert_direction;
};
