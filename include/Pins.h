#pragma once
#include <Arduino.h>

/*
  Pins.h

  Purpose:
  Central location for all Arduino pin assignments for the turns meter.

  Board:
  Arduino Mega 2560

  Notes:
  - Both encoder channels sit on external interrupt pins so the Encoder
    library decodes at full x4 resolution
  - SSD1306 uses the hardware I2C bus (no pin constants needed)
*/

/* ============================================================================
   QUADRATURE ENCODER PINS
   Channel A / B = External Interrupt
============================================================================ */

constexpr uint8_t PIN_ENC_A = 2;  // INT0
constexpr uint8_t PIN_ENC_B = 3;  // INT1

/* ============================================================================
   OLED DISPLAY (SSD1306)
   SDA = D20, SCL = D21 (Wire)
============================================================================ */

// -1 = display shares the Arduino reset line
constexpr int8_t PIN_OLED_RESET = -1;

/* ============================================================================
   SERIAL INTERFACES
============================================================================ */

// USB Serial (Laptop <-> Arduino)
#define SERIAL_USB Serial
