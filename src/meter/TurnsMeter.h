#pragma once
#include <stdint.h>

#include "Params.h"
#include "meter/CountSource.h"
#include "meter/MovingAverageFilter.h"
#include "meter/RateEstimator.h"
#include "meter/WraparoundCounter.h"

/*
===============================================================================
  TurnsMeter.h
===============================================================================

  PURPOSE
  -------
  Owns the whole measurement chain for one encoder:

    source.currentCount() -> WraparoundCounter -> revolutions
                          -> RateEstimator -> MovingAverageFilter -> rpm

  USAGE
  -----
  - Construct once at startup
  - Call tick(source) exactly once per METER period, from one context only
  - Read reading() for the last position / speed
  - reset() only from that same context (it zeroes position, not speed state)

  ERRORS
  ------
  A SAMPLE_TOO_FAR tick is absorbed: position stays where it was, the rate
  chain still runs (so that tick reports zero movement), and tooFarCount()
  goes up. The result is also returned in the Reading for the caller to log.
===============================================================================
*/

class TurnsMeter {
public:
  struct Reading {
    int64_t count = 0;              // cumulative counts
    double revolutions = 0.0;       // count / counts_per_rev
    double rpm_instant = 0.0;       // unfiltered rate of the last tick
    double rpm = 0.0;               // smoothed rate
    uint16_t raw = 0;               // register snapshot used this tick
    SampleResult result = SampleResult::OK;
  };

  /*
    counts_per_rev:
      Counts for one shaft revolution (after quadrature decoding)

    period_s:
      Nominal tick period in seconds

    rate_scale:
      Time base of the reported rate; SECONDS_PER_MINUTE gives rpm
  */
  TurnsMeter(double counts_per_rev = COUNTS_PER_REV,
             double period_s = METER_PERIOD_S,
             double rate_scale = SECONDS_PER_MINUTE);

  const Reading& tick(CountSource& source);

  void reset();

  const Reading& reading() const { return _reading; }

  uint32_t tickCount() const { return _ticks; }
  uint32_t tooFarCount() const { return _too_far; }
  uint16_t previousRaw() const { return _counter.previousRaw(); }

private:
  double toRevolutions_(int64_t count) const;

  double _counts_per_rev;

  WraparoundCounter _counter;
  RateEstimator _rate;
  MovingAverageFilter<RPM_AVERAGE_WINDOW> _rpm_avg;

  Reading _reading;
  uint32_t _ticks = 0;
  uint32_t _too_far = 0;
};
