#pragma once

#include <Arduino.h>
#include <Adafruit_SSD1306.h>

/*
  MeterDisplay

  Purpose:
  - Show the meter reading on a 128x32 SSD1306
  - Top line: smoothed speed, suffix "r" (rpm)
  - Bottom line: position in revolutions, suffix "cn"

  Usage pattern:
  - begin() once in setup(); returns false if the panel does not answer
  - render(revolutions, rpm) at DISPLAY_UPDATE_HZ

  If begin() failed, render() does nothing so the meter keeps running
  without a display.
*/

class MeterDisplay {
public:
  MeterDisplay(uint8_t width, uint8_t height, uint8_t i2c_addr, int8_t reset_pin);

  bool begin(bool dim);

  void setDim(bool dim);

  void render(double revolutions, double rpm);

  bool isReady() const { return _ready; }

private:
  void drawValue_(int16_t y, double value, const char* unit);

  Adafruit_SSD1306 _oled;
  uint8_t _i2c_addr;
  bool _ready = false;
};
