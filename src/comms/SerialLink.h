#pragma once
#include <Arduino.h>

#include "Params.h"
#include "comms/LineAssembler.h"
#include "comms/Messages.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Meter-side serial link handler:

    - Non-blocking read from Stream
    - Accumulate bytes into a newline-delimited line buffer
    - Decode "cmd" frames and store latest valid command
    - Send telemetry frames via Protocol
    - Hold short debug notes that ride along on telemetry (the meter's log)

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

===============================================================================
*/

class SerialLink {
public:
  explicit SerialLink(Stream& serial);

  void begin();

  // Call frequently. Reads any available bytes and decodes complete lines.
  // Never blocks waiting for input.
  void tick(uint32_t now_ms);

  // Convenience aliases
  void RxTick(uint32_t now_ms) { tick(now_ms); }
  void TxTick(const TelemetryFrame& t) { sendTelemetry(t); }

  // True if at least one valid command has been received since boot.
  bool hasCommand() const { return _has_cmd; }

  // Latest successfully decoded command (only meaningful if hasCommand()).
  const CommandFrame& latestCommand() const { return _latest_cmd; }

  // ACK = last command seq that was received + parsed successfully
  uint32_t ackSeq() const { return _ack_seq; }

  // Encodes and writes one telemetry line to the serial stream.
  void sendTelemetry(const TelemetryFrame& t);

  // Record a printf-style note; it is attached to telemetry for
  // DEBUG_NOTE_HOLD_MS. A newer note replaces an older one.
  void note(uint32_t now_ms, const char* fmt, ...);

  const char* debugNote(uint32_t now_ms) const {
    return ((int32_t)(_note_until_ms - now_ms) >= 0 && _note_buf[0] != '\0')
        ? _note_buf : nullptr;
  }

  // RX / TX stats
  uint32_t rxLines() const { return _rx.lines(); }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _rx.overflows(); }
  uint32_t txDropped() const { return _tx_dropped; }

private:
  void handleLine_(uint32_t now_ms);

  Stream& _serial;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  LineAssembler _rx;

  char _tx_buf[TELEMETRY_LINE_BYTES];

  // Latest decoded command
  CommandFrame _latest_cmd;
  bool _has_cmd = false;

  // ACK bookkeeping
  uint32_t _ack_seq = 0;

  // Stats (line / overflow counts live in _rx)
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _tx_dropped = 0;

  // Debug note buffer (for telemetry note)
  char _note_buf[96];
  uint32_t _note_until_ms = 0;
};
