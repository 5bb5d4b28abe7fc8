#include "comms/SerialLink.h"

#include <string.h>
#include <stdarg.h>

#include "comms/Protocol.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Line framing (CR ignored, overflow resync) is done by LineAssembler
  - Each finished line is decoded as a command
  - Telemetry that does not fit the TX buffer is dropped and counted
===============================================================================
*/

constexpr size_t SerialLink::RX_BUF_SIZE;

SerialLink::SerialLink(Stream& serial)
: _serial(serial),
  _rx(_rx_buf, sizeof(_rx_buf))
{
  memset(_tx_buf, 0, sizeof(_tx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
}

void SerialLink::begin() {
  _rx = LineAssembler(_rx_buf, sizeof(_rx_buf));

  _has_cmd = false;
  _ack_seq = 0;

  _ok = _fail = _tx_dropped = 0;

  memset(_note_buf, 0, sizeof(_note_buf));
  _note_until_ms = 0;
}

void SerialLink::sendTelemetry(const TelemetryFrame& t) {
  const size_t n = protocol::encodeTelemetryLine(t, _tx_buf, sizeof(_tx_buf));
  if (n == 0) {
    _tx_dropped++;
    return;
  }
  _serial.write((const uint8_t*)_tx_buf, n);
}

void SerialLink::note(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_until_ms = now_ms + DEBUG_NOTE_HOLD_MS;
}

void SerialLink::tick(uint32_t now_ms) {
  while (_serial.available() > 0) {
    int c = _serial.read();
    if (c < 0) break;

    switch (_rx.push((char)c)) {
      case LineAssembler::Event::LINE:
        handleLine_(now_ms);
        break;

      case LineAssembler::Event::TOO_LONG:
        // line() still holds the head of the dropped frame
        note(now_ms, "RX OVF ovf=%lu head=%.24s",
             (unsigned long)_rx.overflows(),
             _rx.line());
        break;

      case LineAssembler::Event::NONE:
        break;
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  if (_rx.length() == 0) return;

  CommandFrame cmd;
  if (protocol::decodeCommandLine(_rx.line(), cmd) && cmd.valid) {
    _latest_cmd = cmd;
    _has_cmd = true;
    _ack_seq = cmd.seq;
    _ok++;

    if (ENABLE_SERIAL_DEBUG) {
      note(now_ms, "RX OK seq=%lu len=%u",
           (unsigned long)cmd.seq,
           (unsigned)_rx.length());
    }
  } else {
    _fail++;

    note(now_ms,
         "RX FAIL (lines=%lu ok=%lu fail=%lu) len=%u head=%.24s",
         (unsigned long)_rx.lines(),
         (unsigned long)_ok,
         (unsigned long)_fail,
         (unsigned)_rx.length(),
         _rx.line());
  }
}
