#include "meter/TurnsMeter.h"

TurnsMeter::TurnsMeter(double counts_per_rev,
                       double period_s,
                       double rate_scale)
: _rate(period_s, rate_scale)
{
  if (counts_per_rev > 0.0) {
    _counts_per_rev = counts_per_rev;
  } else {
    _counts_per_rev = 1.0;
  }
}

double TurnsMeter::toRevolutions_(int64_t count) const {
  return (double)count / _counts_per_rev;
}

const TurnsMeter::Reading& TurnsMeter::tick(CountSource& source) {
  const uint16_t raw = source.currentCount();
  const SampleResult res = _counter.sample(raw);

  if (res != SampleResult::OK) {
    _too_far++;
  }

  const int64_t count_now = _counter.count();
  const double rev_now = toRevolutions_(count_now);

  // Runs on error ticks too: position did not move, so this tick's delta is 0
  const double rpm_now = _rate.update(rev_now);

  _reading.count = count_now;
  _reading.revolutions = rev_now;
  _reading.rpm_instant = rpm_now;
  _reading.rpm = _rpm_avg.feed(rpm_now);
  _reading.raw = raw;
  _reading.result = res;

  _ticks++;
  return _reading;
}

void TurnsMeter::reset() {
  _counter.reset();

  // The jump to zero is not motion
  _rate.rebase(0.0);

  _reading.count = 0;
  _reading.revolutions = 0.0;
}
