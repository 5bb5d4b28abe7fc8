/*
  Winding Turns Meter (Arduino Mega 2560)

  Purpose:
  Count shaft turns from a quadrature encoder and show position (revolutions)
  and smoothed speed (rpm) on an SSD1306, with JSON telemetry over USB.

  Loop tasks (each on its own Rate):
  - METER: sample encoder -> unwrap -> rate -> moving average
  - RX: parse host commands (reset position, display dim)
  - DISPLAY: redraw the two values
  - TX: publish telemetry + latest debug note
*/

#include <Arduino.h>

#include "Pins.h"
#include "Params.h"

#include "utils/Rate.h"
#include "comms/SerialLink.h"
#include "meter/TurnsMeter.h"
#include "sensors/QeiCountSource.h"
#include "display/MeterDisplay.h"



/*=============================================================================
  GLOBALS
=============================================================================*/

// Serial link (USB)
SerialLink g_link(SERIAL_USB);

// Encoder register snapshot
QeiCountSource g_qei(PIN_ENC_A, PIN_ENC_B, ENCODER_INVERT_DIRECTION);

// Counter + rate + smoothing. Only touched from loop().
TurnsMeter g_meter(COUNTS_PER_REV, METER_PERIOD_S, SECONDS_PER_MINUTE);

// Display
MeterDisplay g_display(OLED_WIDTH, OLED_HEIGHT, OLED_I2C_ADDR, PIN_OLED_RESET);

// Rates
Rate g_meter_rate(METER_UPDATE_HZ);
Rate g_comms_rate(RxCOMM_UPDATE_HZ);
Rate g_display_rate(DISPLAY_UPDATE_HZ);
Rate g_telemetry_rate(TELEMETRY_UPDATE_HZ);

// Track last applied command seq so each command is applied once
static uint32_t g_last_applied_seq = 0;


/*=============================================================================
  HELPERS
=============================================================================*/

static void applyCommand(const CommandFrame& cmd, uint32_t now_ms) {
  if (cmd.reset) {
    g_meter.reset();
    g_link.note(now_ms, "RESET seq=%lu", (unsigned long)cmd.seq);
  }

  if (cmd.dim_present) {
    g_display.setDim(cmd.dim);
  }
}

static void meterTick(uint32_t now_ms) {
  const TurnsMeter::Reading& r = g_meter.tick(g_qei);

  if (r.result == SampleResult::SAMPLE_TOO_FAR) {
    // Skip-and-continue: position held, next tick retries against prev
    g_link.note(now_ms, "QEI SAMPLE_TOO_FAR raw=%u prev=%u n=%lu",
                (unsigned)r.raw,
                (unsigned)g_meter.previousRaw(),
                (unsigned long)g_meter.tooFarCount());
  }
}


/*=============================================================================
  SETUP
=============================================================================*/

void setup() {
  // Serial Comms Setup
  SERIAL_USB.begin(SERIAL_BAUD);
  g_link.begin();

  // Encoder Setup
  g_qei.begin();

  // Display Setup
  if (!g_display.begin(DISPLAY_START_DIM)) {
    g_link.note(millis(), "OLED init failed addr=0x%02X", (unsigned)OLED_I2C_ADDR);
  } else {
    g_link.note(millis(), "BOOT cpr=%d hz=%u win=%u",
                COUNTS_PER_REV,
                (unsigned)METER_UPDATE_HZ,
                (unsigned)RPM_AVERAGE_WINDOW);
  }
}

/*=============================================================================
  LOOP
=============================================================================*/

void loop() {

  const uint32_t now_ms = millis();

  // Meter tick first so it keeps the tightest cadence
  if (g_meter_rate.ready(now_ms)) {
    meterTick(now_ms);
  }

  // RX tick: read serial and parse command frames
  if (g_comms_rate.ready(now_ms)) {
    g_link.RxTick(now_ms);

    if (g_link.hasCommand()) {
      const CommandFrame& cmd = g_link.latestCommand();
      if (isNewCommand(cmd, g_last_applied_seq)) {
        g_last_applied_seq = cmd.seq;
        applyCommand(cmd, now_ms);
      }
    }
  }

  // Display tick
  if (g_display_rate.ready(now_ms)) {
    const TurnsMeter::Reading& r = g_meter.reading();
    g_display.render(r.revolutions, r.rpm);
  }

  // TX tick: publish telemetry
  if (g_telemetry_rate.ready(now_ms)) {
    const TurnsMeter::Reading& r = g_meter.reading();

    TelemetryFrame t;
    t.time_ms = now_ms;
    t.ack_seq = g_link.ackSeq();

    t.count = r.count;
    t.revolutions = r.revolutions;
    t.rpm = r.rpm;

    t.too_far = g_meter.tooFarCount();
    t.late_ticks = g_meter_rate.lateTicks();

    t.note = g_link.debugNote(now_ms);

    g_link.TxTick(t);
  }

}
