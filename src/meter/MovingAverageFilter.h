#pragma once
#include <stddef.h>

/*
===============================================================================
  MovingAverageFilter.h
===============================================================================

  PURPOSE
  -------
  Fixed-capacity moving average (ring buffer + running sum). No heap,
  O(1) per feed(), safe to call from the tick.

  NOTES
  -----
  - Until N samples have been fed, the average is taken over the samples
    actually held, so the first readings are not pulled toward zero.
  - get() on an empty filter returns 0.
===============================================================================
*/

template <size_t N>
class MovingAverageFilter {
  static_assert(N > 0, "MovingAverageFilter needs a capacity of at least 1");

public:
  // Push one sample and return the new average.
  double feed(double value) {
    if (_filled < N) {
      _window[_filled] = value;
      _filled++;
      _sum += value;
    } else {
      const double evicted = _window[_next];
      _window[_next] = value;
      _sum += value - evicted;
      _next = (_next + 1) % N;
    }
    return get();
  }

  double get() const {
    if (_filled == 0) return 0.0;
    return _sum / (double)_filled;
  }

  size_t size() const { return _filled; }
  static constexpr size_t capacity() { return N; }

private:
  double _window[N] = {};
  double _sum = 0.0;
  size_t _filled = 0;
  size_t _next = 0;    // oldest slot once full
};
