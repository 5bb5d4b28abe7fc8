#pragma once
#include <stdint.h>
#include <stddef.h>

/*
  Params.h

  Purpose:
  Central location for turns meter constants and tunable parameters.

  Board:
  Arduino Mega 2560

  Convention:
  - Position: encoder counts internally, revolutions when reported
  - Speed: revolutions per minute (rpm)
  - Time: seconds for math, milliseconds for scheduling
*/

/* ============================================================================
   ENCODER PARAMETERS
============================================================================ */

// Encoder hardware
constexpr int ENCODER_CPR = 1024;          // lines per shaft rev
constexpr int QUADRATURE_FACTOR = 4;       // x4 decoding

// Derived counts
constexpr int COUNTS_PER_REV = ENCODER_CPR * QUADRATURE_FACTOR;

// Set true if clockwise winding reads as negative count
constexpr bool ENCODER_INVERT_DIRECTION = false;

// The hardware snapshot is 16 bits wide. Half its range is the largest
// move between two samples that can still be told apart from a wrap.
constexpr uint32_t QEI_COUNTER_RANGE = 65536UL;
constexpr uint32_t QEI_WRAP_THRESHOLD = QEI_COUNTER_RANGE / 2;

/* ============================================================================
   METER (sampling + rate)
============================================================================ */

// Sample / estimate / smooth cadence. Rate math assumes this exact period.
constexpr uint16_t METER_UPDATE_HZ = 20;
constexpr double METER_PERIOD_S = 1.0 / METER_UPDATE_HZ;

// Rate is reported per minute
constexpr double SECONDS_PER_MINUTE = 60.0;

// Moving average over the last N rate samples (1 s at 20 Hz)
constexpr size_t RPM_AVERAGE_WINDOW = 20;

// Fastest shaft speed the meter is rated for
constexpr double MAX_SHAFT_RPM = 3000.0;

// Counts moved during one tick at MAX_SHAFT_RPM
constexpr double MAX_COUNTS_PER_TICK =
    (MAX_SHAFT_RPM / SECONDS_PER_MINUTE) * COUNTS_PER_REV * METER_PERIOD_S;

// Wrap disambiguation only holds if one tick never moves half the counter
static_assert(MAX_COUNTS_PER_TICK < (double)QEI_WRAP_THRESHOLD,
              "METER_UPDATE_HZ too slow for MAX_SHAFT_RPM");

/* ============================================================================
   DISPLAY (SSD1306 128x32, I2C)
============================================================================ */

constexpr uint8_t OLED_WIDTH = 128;
constexpr uint8_t OLED_HEIGHT = 32;
constexpr uint8_t OLED_I2C_ADDR = 0x3C;
constexpr uint32_t OLED_I2C_CLOCK_HZ = 400000UL;

constexpr bool DISPLAY_START_DIM = true;
constexpr uint8_t DISPLAY_DECIMALS = 3;

// Values beyond this are pinned to it on screen (telemetry is not clamped)
constexpr double DISPLAY_VALUE_LIMIT = 999999.999;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t DISPLAY_UPDATE_HZ   = 20;
constexpr uint16_t RxCOMM_UPDATE_HZ    = 200;
constexpr uint16_t TELEMETRY_UPDATE_HZ = 10;

/* ============================================================================
   TELEMETRY / COMMS
============================================================================ */

constexpr uint32_t SERIAL_BAUD = 115200;
constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 128;
constexpr size_t TELEMETRY_LINE_BYTES = 320;

// How long a debug note stays attached to telemetry (ms)
constexpr uint32_t DEBUG_NOTE_HOLD_MS = 1500;

/* ============================================================================
   DEBUG FLAGS
============================================================================ */

constexpr bool ENABLE_SERIAL_DEBUG = false;
