#pragma once
#include <stdint.h>
#include <math.h>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines command and telemetry data structures exchanged between the
  meter and a host over newline-delimited JSON.

  Notes:
  - Optional numeric fields use NAN and are encoded as JSON null.
  - Optional command fields carry a matching *_present flag.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Host -> Meter)
=============================================================================*/

// {"type":"cmd","seq":<u32>,"reset":<bool>,"dim":<bool>|null}
// A command is applied once per new seq; hosts start counting at 1.
struct CommandFrame {
  uint32_t seq = 0;

  bool reset = false;         // zero the cumulative position

  bool dim = false;           // display dimming
  bool dim_present = false;

  bool valid = false;         // set true after successful decode
};

// True if cmd has not been applied yet. seq 0 is never applied.
inline bool isNewCommand(const CommandFrame& cmd, uint32_t last_applied_seq) {
  return cmd.valid && cmd.seq != 0 && cmd.seq != last_applied_seq;
}


/*=============================================================================
  TELEMETRY STRUCTURES (Meter -> Host)
=============================================================================*/

struct TelemetryFrame {
  uint32_t time_ms = 0;
  uint32_t ack_seq = 0;

  int64_t count = 0;            // cumulative encoder counts
  double revolutions = NAN;
  double rpm = NAN;             // smoothed

  uint32_t too_far = 0;         // ticks absorbed as SAMPLE_TOO_FAR
  uint32_t late_ticks = 0;      // meter ticks the scheduler lost

  const char* note = nullptr;   // optional debug string
};
