#include "display/MeterDisplay.h"

#include <Wire.h>
#include <stdlib.h>   // dtostrf
#include <string.h>

#include "Params.h"
#include "display/DisplayFormat.h"

using display_format::LINE_BUF_BYTES;
using display_format::VALUE_WIDTH;

// Bus rate is owned by the driver (clkDuring / clkAfter), not Wire.setClock()
MeterDisplay::MeterDisplay(uint8_t width, uint8_t height, uint8_t i2c_addr, int8_t reset_pin)
: _oled(width, height, &Wire, reset_pin, OLED_I2C_CLOCK_HZ, OLED_I2C_CLOCK_HZ),
  _i2c_addr(i2c_addr)
{
}

bool MeterDisplay::begin(bool dim) {
  _ready = _oled.begin(SSD1306_SWITCHCAPVCC, _i2c_addr);
  if (!_ready) return false;

  _oled.dim(dim);
  _oled.setTextWrap(false);
  _oled.setTextColor(SSD1306_WHITE);
  _oled.setTextSize(1);
  _oled.clearDisplay();
  _oled.display();
  return true;
}

void MeterDisplay::setDim(bool dim) {
  if (!_ready) return;
  _oled.dim(dim);
}

void MeterDisplay::drawValue_(int16_t y, double value, const char* unit) {
  char line[LINE_BUF_BYTES];

  // AVR printf has no %f; dtostrf right-aligns into the given width
  dtostrf(display_format::clampValue(value), VALUE_WIDTH, DISPLAY_DECIMALS, line);
  strncat(line, " ", sizeof(line) - strlen(line) - 1);
  strncat(line, unit, sizeof(line) - strlen(line) - 1);

  _oled.setCursor(0, y);
  _oled.print(line);
}

void MeterDisplay::render(double revolutions, double rpm) {
  if (!_ready) return;

  _oled.clearDisplay();
  _oled.setTextSize(1);

  drawValue_(4, rpm, "r");
  drawValue_(20, revolutions, "cn");

  _oled.display();
}
