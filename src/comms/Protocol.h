#pragma once
#include <stddef.h>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the meter <-> host wire protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
    - Meter -> Host: type="telemetry"
    - Host -> Meter: type="cmd"
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Meter -> Host)
=============================================================================*/

/*
  Writes one telemetry JSON line (including trailing '\n' and a '\0') into
  out.

  Returns:
    - number of bytes in the line (without '\0')
    - 0 if the line does not fit in out_size
*/
size_t encodeTelemetryLine(const TelemetryFrame& t, char* out, size_t out_size);


/*=============================================================================
  DECODE (Host -> Meter)
=============================================================================*/

/*
  Attempts to parse one command JSON line.

  Returns:
    - true if decoded into out_cmd (and out_cmd.valid will be true)
    - false if not a valid command frame or parse failed
*/
bool decodeCommandLine(const char* line, CommandFrame& out_cmd);

}  // namespace protocol
