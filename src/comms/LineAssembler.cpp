#include "comms/LineAssembler.h"

LineAssembler::LineAssembler(char* buf, size_t buf_size)
: _buf(buf),
  _size(buf_size)
{
  clear();
}

void LineAssembler::clear() {
  _len = 0;
  _done = false;
  _dropping = false;
  if (_size > 0) _buf[0] = '\0';
}

LineAssembler::Event LineAssembler::push(char ch) {
  if (_done) {
    // Previous line (or overflow head) has been handed out
    _len = 0;
    _buf[0] = '\0';
    _done = false;
  }

  if (ch == '\r') return Event::NONE;

  if (_dropping) {
    if (ch == '\n') {
      _dropping = false;
    }
    return Event::NONE;
  }

  if (ch == '\n') {
    _buf[_len] = '\0';
    _lines++;
    _done = true;
    return Event::LINE;
  }

  // Leave space for '\0'
  if (_len + 1 < _size) {
    _buf[_len++] = ch;
    return Event::NONE;
  }

  // Keep the head readable for diagnostics
  _buf[_len] = '\0';
  _ovf++;
  _dropping = true;
  _done = true;
  return Event::TOO_LONG;
}
