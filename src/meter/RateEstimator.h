#pragma once

/*
  RateEstimator

  Purpose:
  - Turn a position sampled at a fixed period into a rate
  - rate = (position - last_position) * (scale / period_s)

  Notes:
  - period_s is the nominal tick period, not a measured dt. The tick driver
    owns keeping that period.
  - scale converts the time base, e.g. 60.0 for "per minute" when period_s
    is in seconds.
*/

class RateEstimator {
public:
  RateEstimator(double period_s, double scale = 1.0);

  // Returns the instantaneous rate for this tick and remembers position.
  double update(double current_position);

  // Move the reference position without producing a rate, e.g. after the
  // position source was zeroed.
  void rebase(double position) { _last_position = position; }

  double lastPosition() const { return _last_position; }

private:
  double _factor;            // scale / period_s
  double _last_position = 0.0;
};
