#include "comms/Protocol.h"
#include <math.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Notes:
  - Telemetry is serialized into a caller buffer so SerialLink can write it
    in one call (and so the encoder runs off-target).
  - Command decoding uses ArduinoJson for safe parsing.
===============================================================================
*/

// count is int64_t; AVR builds default this off
#define ARDUINOJSON_USE_LONG_LONG 1
#include <ArduinoJson.h>
#include <string.h>


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Optional bool field: missing/null leaves defaults, wrong type fails
static bool readOptionalBool(JsonObject obj, const char* key, bool& value, bool& present) {
  JsonVariant v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<bool>()) return false;
  value = v.as<bool>();
  present = true;
  return true;
}

static void putFiniteOrNull(JsonObject obj, const char* key, double value) {
  if (isfinite(value))
    obj[key] = value;
  else
    obj[key] = nullptr;
}


namespace protocol {

/*=============================================================================
  ENCODE (Meter -> Host)
=============================================================================*/

size_t encodeTelemetryLine(const TelemetryFrame& t, char* out, size_t out_size) {
  if (!out || out_size == 0) return 0;
  out[0] = '\0';

  StaticJsonDocument<384> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["type"] = "telemetry";
  obj["time_ms"] = t.time_ms;
  obj["ack_seq"] = t.ack_seq;

  obj["count"] = t.count;
  putFiniteOrNull(obj, "revolutions", t.revolutions);
  putFiniteOrNull(obj, "rpm", t.rpm);

  obj["too_far"] = t.too_far;
  obj["late_ticks"] = t.late_ticks;

  if (t.note)
    obj["note"] = t.note;
  else
    obj["note"] = nullptr;

  if (doc.overflowed()) return 0;

  // Room for the JSON, '\n' and '\0'
  const size_t len = measureJson(doc);
  if (len + 2 > out_size) return 0;

  serializeJson(doc, out, out_size);
  out[len] = '\n';
  out[len + 1] = '\0';
  return len + 1;
}


/*=============================================================================
  DECODE (Host -> Meter)
=============================================================================*/

bool decodeCommandLine(const char* line, CommandFrame& out_cmd) {
  out_cmd = CommandFrame();   // reset everything
  if (!line) return false;

  // Input is const, so keys/strings are copied into the pool
  StaticJsonDocument<256> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  // Must be a command
  const char* type = obj["type"];
  if (!type || strcmp(type, "cmd") != 0) return false;

  // Fill a scratch frame so a late failure leaves out_cmd cleared
  CommandFrame cmd;

  // Required fields
  if (!obj["seq"].is<uint32_t>()) return false;
  cmd.seq = obj["seq"].as<uint32_t>();

  bool reset_present = false;
  if (!readOptionalBool(obj, "reset", cmd.reset, reset_present)) return false;
  if (!readOptionalBool(obj, "dim", cmd.dim, cmd.dim_present)) return false;

  cmd.valid = true;
  out_cmd = cmd;
  return true;
}

}  // namespace protocol
