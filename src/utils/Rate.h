#pragma once

#include <stdint.h>

/*
  Rate

  Fixed-period tick driver polled from loop(). ready(now_ms) returns true
  once per period and schedules the next tick on the period grid.

  A poll that arrives a whole period (or more) after its due time means at
  least one tick was skipped. Those are counted in lateTicks(): for the
  meter a skipped tick doubles the counts moved between samples.
*/
class Rate {
public:
  // hz = how many times per second you want to run
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    setPeriodMs((uint32_t)(1000UL / hz));
  }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;      // run immediately on first call
      _initialized = true;
    }

    // Safe with millis() rollover because of signed subtraction trick
    const int32_t overdue_ms = (int32_t)(now_ms - _next_ms);
    if (overdue_ms < 0) {
      return false;
    }

    if ((uint32_t)overdue_ms >= _period_ms) {
      // Whole periods were lost; restart the grid from now
      _late_ticks += (uint32_t)overdue_ms / _period_ms;
      _next_ms = now_ms + _period_ms;
    } else {
      // Stay on the grid so jitter does not accumulate
      _next_ms += _period_ms;
    }
    return true;
  }

  uint32_t periodMs() const { return _period_ms; }
  uint32_t nextMs() const { return _next_ms; }
  uint32_t lateTicks() const { return _late_ticks; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  uint32_t _late_ticks = 0;
  bool _initialized = false;
};
