#include "meter/WraparoundCounter.h"

/*
===============================================================================
  WraparoundCounter.cpp
===============================================================================

  Up-counting = positive. For each pair (previous, raw) there are two
  candidate moves around the 65536-count circle; the shorter one wins.
===============================================================================
*/

constexpr uint16_t WraparoundCounter::THRESHOLD;

static constexpr int32_t COUNTER_RANGE = 65536L;

SampleResult WraparoundCounter::sample(uint16_t raw) {
  if (raw == _previous_raw) {
    return SampleResult::OK;
  }

  if (raw > _previous_raw) {
    const uint16_t up = (uint16_t)(raw - _previous_raw);

    if (up < THRESHOLD) {
      // Counting up, no overflow
      _counter += up;
    } else if (up > THRESHOLD) {
      // Counting down through 0 (underflow)
      _counter -= (COUNTER_RANGE - (int32_t)up);
    } else {
      return SampleResult::SAMPLE_TOO_FAR;
    }
  } else {
    const uint16_t down = (uint16_t)(_previous_raw - raw);

    if (down < THRESHOLD) {
      // Counting down, no underflow
      _counter -= down;
    } else if (down > THRESHOLD) {
      // Counting up through 65535 (overflow)
      _counter += (COUNTER_RANGE - (int32_t)down);
    } else {
      return SampleResult::SAMPLE_TOO_FAR;
    }
  }

  _previous_raw = raw;
  return SampleResult::OK;
}
