#include <gtest/gtest.h>

#include <math.h>
#include <stdio.h>
#include <string.h>

#include "Params.h"
#include "display/DisplayFormat.h"

using namespace display_format;

namespace {

// Host stand-in for dtostrf(value, VALUE_WIDTH, DISPLAY_DECIMALS, ...)
size_t formattedLength(double value) {
  char tmp[64];
  const int n = snprintf(tmp, sizeof(tmp), "%*.*f",
                         (int)VALUE_WIDTH, (int)DISPLAY_DECIMALS, clampValue(value));
  return n < 0 ? 0 : (size_t)n;
}

}  // namespace

TEST(DisplayFormat, InRangeValuesPassThrough) {
  EXPECT_EQ(clampValue(0.0), 0.0);
  EXPECT_EQ(clampValue(1234.567), 1234.567);
  EXPECT_EQ(clampValue(-42.0), -42.0);
  EXPECT_EQ(clampValue(DISPLAY_VALUE_LIMIT), DISPLAY_VALUE_LIMIT);
}

TEST(DisplayFormat, LargeValuesArePinned) {
  EXPECT_EQ(clampValue(1e7), DISPLAY_VALUE_LIMIT);
  EXPECT_EQ(clampValue(-1e7), -DISPLAY_VALUE_LIMIT);
  EXPECT_EQ(clampValue(1e300), DISPLAY_VALUE_LIMIT);
  EXPECT_EQ(clampValue(INFINITY), DISPLAY_VALUE_LIMIT);
  EXPECT_EQ(clampValue(-INFINITY), -DISPLAY_VALUE_LIMIT);
}

TEST(DisplayFormat, NanIsLeftAlone) {
  EXPECT_TRUE(isnan(clampValue(NAN)));
}

TEST(DisplayFormat, WidestValueFitsLineBuffer) {
  const double worst[] = {1e300, -1e300, 1e7, -1e7,
                          DISPLAY_VALUE_LIMIT, -DISPLAY_VALUE_LIMIT, -0.001};
  for (double v : worst) {
    EXPECT_LE(formattedLength(v), VALUE_MAX_CHARS) << "value=" << v;
  }

  // value + " cn" + '\0'
  EXPECT_LE(VALUE_MAX_CHARS + 1 + strlen("cn") + 1, LINE_BUF_BYTES);
}

TEST(DisplayFormat, I2cClockIsFastModeOrSlower) {
  // Passed to the SSD1306 driver for both clkDuring and clkAfter
  EXPECT_GT(OLED_I2C_CLOCK_HZ, 0u);
  EXPECT_LE(OLED_I2C_CLOCK_HZ, 400000u);
}
