#include <gtest/gtest.h>

#include <vector>

#include "Params.h"
#include "meter/TurnsMeter.h"

namespace {

// Replays a fixed list of register snapshots, then holds the last one
class ScriptedSource : public CountSource {
public:
  explicit ScriptedSource(std::vector<uint16_t> samples) : _samples(samples) {}

  uint16_t currentCount() override {
    _reads++;
    if (_next < _samples.size()) {
      _last = _samples[_next++];
    }
    return _last;
  }

  size_t reads() const { return _reads; }

private:
  std::vector<uint16_t> _samples;
  size_t _next = 0;
  size_t _reads = 0;
  uint16_t _last = 0;
};

// Shaft turning at a constant number of counts per tick
class SpinningSource : public CountSource {
public:
  explicit SpinningSource(int32_t counts_per_tick) : _step(counts_per_tick) {}

  uint16_t currentCount() override {
    _pos += _step;
    return (uint16_t)_pos;
  }

private:
  int32_t _step;
  int64_t _pos = 0;
};

}  // namespace

TEST(TurnsMeter, ReadsSourceOncePerTick) {
  ScriptedSource src({10, 20, 30});
  TurnsMeter meter(4096.0, 0.05, 60.0);

  meter.tick(src);
  meter.tick(src);
  EXPECT_EQ(src.reads(), 2u);
  EXPECT_EQ(meter.tickCount(), 2u);
}

TEST(TurnsMeter, ReportsCountAndRevolutions) {
  ScriptedSource src({2048, 4096, 8192});
  TurnsMeter meter(4096.0, 0.05, 60.0);

  meter.tick(src);
  meter.tick(src);
  const TurnsMeter::Reading& r = meter.tick(src);

  EXPECT_EQ(r.count, 8192);
  EXPECT_DOUBLE_EQ(r.revolutions, 2.0);
  EXPECT_EQ(r.raw, 8192);
  EXPECT_EQ(r.result, SampleResult::OK);
}

TEST(TurnsMeter, StationaryShaftHasZeroRate) {
  ScriptedSource src({500});
  TurnsMeter meter(4096.0, 0.05, 60.0);

  meter.tick(src);
  for (int i = 0; i < 5; ++i) {
    const TurnsMeter::Reading& r = meter.tick(src);
    EXPECT_EQ(r.rpm_instant, 0.0);
  }
}

TEST(TurnsMeter, ConstantSpeedSettlesToRpm) {
  // 1024 counts per 50 ms tick = 0.25 rev / 0.05 s = 300 rpm
  SpinningSource src(1024);
  TurnsMeter meter(4096.0, 0.05, 60.0);

  for (size_t i = 0; i < RPM_AVERAGE_WINDOW * 3; ++i) {
    meter.tick(src);
  }
  EXPECT_NEAR(meter.reading().rpm, 300.0, 1e-9);
  EXPECT_NEAR(meter.reading().rpm_instant, 300.0, 1e-9);
}

TEST(TurnsMeter, CountsThroughManyWrapsBackward) {
  // 3000 counts per tick backwards: wraps every ~22 ticks
  SpinningSource src(-3000);
  TurnsMeter meter(4096.0, 0.05, 60.0);

  for (int i = 0; i < 1000; ++i) {
    meter.tick(src);
  }
  EXPECT_EQ(meter.reading().count, -3000LL * 1000);
  EXPECT_EQ(meter.tooFarCount(), 0u);
  EXPECT_NEAR(meter.reading().rpm, -3000.0 / 4096.0 * 20.0 * 60.0, 1e-6);
}

TEST(TurnsMeter, TooFarTickIsAbsorbed) {
  ScriptedSource src({1000, 1000 + 32768, 1100});
  TurnsMeter meter(4096.0, 0.05, 60.0);

  meter.tick(src);
  const TurnsMeter::Reading& bad = meter.tick(src);
  EXPECT_EQ(bad.result, SampleResult::SAMPLE_TOO_FAR);
  EXPECT_EQ(bad.count, 1000);
  EXPECT_EQ(bad.rpm_instant, 0.0);
  EXPECT_EQ(meter.tooFarCount(), 1u);
  EXPECT_EQ(meter.previousRaw(), 1000);

  // Next tick is measured against the last good sample
  const TurnsMeter::Reading& good = meter.tick(src);
  EXPECT_EQ(good.result, SampleResult::OK);
  EXPECT_EQ(good.count, 1100);
  EXPECT_EQ(meter.tooFarCount(), 1u);
}

TEST(TurnsMeter, ResetZeroesPositionWithoutRateSpike) {
  ScriptedSource src({4096, 8192, 8192, 8292});
  TurnsMeter meter(4096.0, 0.05, 60.0);

  meter.tick(src);
  meter.tick(src);
  ASSERT_EQ(meter.reading().count, 8192);

  meter.reset();
  EXPECT_EQ(meter.reading().count, 0);
  EXPECT_EQ(meter.reading().revolutions, 0.0);

  // Stationary after reset: no negative jump in rate
  const TurnsMeter::Reading& r = meter.tick(src);
  EXPECT_EQ(r.count, 0);
  EXPECT_EQ(r.rpm_instant, 0.0);

  const TurnsMeter::Reading& moved = meter.tick(src);
  EXPECT_EQ(moved.count, 100);
}

TEST(TurnsMeter, InvalidCountsPerRevFallsBackToCounts) {
  ScriptedSource src({7});
  TurnsMeter meter(0.0, 0.05, 60.0);

  EXPECT_DOUBLE_EQ(meter.tick(src).revolutions, 7.0);
}

TEST(TurnsMeter, DefaultsMatchParams) {
  // One full revolution in a single tick at the default configuration
  ScriptedSource src({(uint16_t)(COUNTS_PER_REV)});
  TurnsMeter meter;

  const TurnsMeter::Reading& r = meter.tick(src);
  EXPECT_DOUBLE_EQ(r.revolutions, 1.0);
  EXPECT_NEAR(r.rpm_instant, METER_UPDATE_HZ * SECONDS_PER_MINUTE, 1e-9);
}
