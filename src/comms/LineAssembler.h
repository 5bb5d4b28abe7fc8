#pragma once
#include <stdint.h>
#include <stddef.h>

/*
===============================================================================
  LineAssembler.h
===============================================================================

  PURPOSE
  -------
  Byte-in / line-out framing for newline-delimited input. No I/O of its
  own: SerialLink feeds it from a Stream, tests feed it from strings.

  RULES
  -----
  - '\r' is ignored
  - '\n' ends a line (empty lines are still counted)
  - A line of up to N-1 bytes fits. One byte more and the line is
    discarded: everything up to the next '\n' is dropped, so no tail
    fragment is ever handed out as a line.
===============================================================================
*/

class LineAssembler {
public:
  enum class Event : uint8_t {
    NONE = 0,     // byte consumed, nothing finished
    LINE,         // line() holds a complete line
    TOO_LONG,     // line too long; dropping until next '\n'
  };

  // buf must hold at least one byte
  LineAssembler(char* buf, size_t buf_size);

  Event push(char ch);

  void clear();

  // Valid after push() returned LINE, until the next push()
  const char* line() const { return _buf; }
  size_t length() const { return _len; }

  bool dropping() const { return _dropping; }

  uint32_t lines() const { return _lines; }
  uint32_t overflows() const { return _ovf; }

private:
  char* _buf;
  size_t _size;
  size_t _len = 0;

  // Buffer holds a handed-out line; start over on the next byte
  bool _done = false;

  bool _dropping = false;

  uint32_t _lines = 0;
  uint32_t _ovf = 0;
};
