#include "meter/RateEstimator.h"

RateEstimator::RateEstimator(double period_s, double scale)
{
  if (!(period_s > 0.0)) {
    period_s = 1.0;
  }
  _factor = scale / period_s;
}

double RateEstimator::update(double current_position) {
  const double delta = current_position - _last_position;
  _last_position = current_position;
  return delta * _factor;
}
