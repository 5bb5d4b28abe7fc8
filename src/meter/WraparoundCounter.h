#pragma once
#include <stdint.h>

/*
===============================================================================
  WraparoundCounter.h
===============================================================================

  PURPOSE
  -------
  Extends a 16-bit quadrature counter register (which overflows/underflows
  constantly) into a signed 64-bit cumulative position.

  USAGE
  -----
  - Call sample(raw) once per tick with a fresh register snapshot
  - Read count() for the cumulative position in counts

  IMPORTANT
  ---------
  The wrap direction is inferred from the shortest way around the 16-bit
  circle. The shaft must move strictly less than 2^15 counts between two
  samples; the tick rate has to be chosen for that against the fastest
  expected shaft speed (see MAX_SHAFT_RPM in Params.h).

  A move of exactly 2^15 is ambiguous and returns SAMPLE_TOO_FAR with no
  state change. A move larger than 2^15 cannot be detected and is read as
  a shorter move in the opposite direction.

  Invariant: (uint16_t)count() == previousRaw()  (until reset())
===============================================================================
*/

enum class SampleResult : uint8_t {
  OK = 0,
  SAMPLE_TOO_FAR,   // displacement was exactly half the register range
};

class WraparoundCounter {
public:
  static constexpr uint16_t THRESHOLD = 32768;

  WraparoundCounter() = default;

  // Feed one raw register snapshot. On SAMPLE_TOO_FAR nothing changes and
  // the next sample is disambiguated against the same previous value.
  SampleResult sample(uint16_t raw);

  int64_t count() const { return _counter; }

  // Zero the cumulative position. The previous sample is kept so the next
  // sample() does not see a jump.
  void reset() { _counter = 0; }

  uint16_t previousRaw() const { return _previous_raw; }

private:
  int64_t _counter = 0;
  uint16_t _previous_raw = 0;
};
