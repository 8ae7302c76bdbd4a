#include "battery_display.hpp"

namespace {

const uint8_t LEVEL_TAB[BATTERY_DISPLAY_MAX_SEGMENTS] = {
  0b00000000,
  0b00000001,
  0b00000011,
  0b00000111,
  0b00001111,
  0b00011111,
  0b00111111,
  0b01111111,
};

}  // namespace


BatteryDisplay::BatteryDisplay(GpioBackend& gpio, BusDelay& delay, int clock_pin, int data_pin, int segments,
                               unsigned long clock_cycle_ns)
  : SEGMENTS(validate(clock_pin, data_pin, segments)),
    bus(gpio, delay, static_cast<unsigned int>(clock_pin), static_cast<unsigned int>(data_pin), clock_cycle_ns),
    commands(bus) {

  bus.setup();

  set_brightness(static_cast<int>(Brightness::DARK));

  // No ack on any byte of the clear: nothing is listening on these pins.
  if(!clear_display()) {
    throw DisplayError::no_device_found(bus.clock_pin(), bus.data_pin());
  }
}

int BatteryDisplay::validate(int clock_pin, int data_pin, int segments) {
  if(clock_pin < GPIO_PIN_MIN || clock_pin > GPIO_PIN_MAX) {
    throw DisplayError::invalid_pin(clock_pin);
  }
  if(data_pin < GPIO_PIN_MIN || data_pin > GPIO_PIN_MAX || data_pin == clock_pin) {
    throw DisplayError::invalid_pin(data_pin);
  }
  if(segments < 1 || segments > BATTERY_DISPLAY_MAX_SEGMENTS) {
    throw DisplayError::invalid_segment_count(segments);
  }
  return segments;
}

uint8_t BatteryDisplay::level_mask(int level) {
  if(level < 0 || level >= BATTERY_DISPLAY_MAX_SEGMENTS) {
    throw DisplayError::invalid_level(level);
  }
  return LEVEL_TAB[level];
}

void BatteryDisplay::set_brightness(int brightness) {
  if(brightness < 0 || brightness > BATTERY_DISPLAY_MAX_BRIGHTNESS) {
    throw DisplayError::invalid_brightness(brightness);
  }
  current_brightness = brightness;
}

bool BatteryDisplay::set_level(int level) {
  if(level < 0 || level >= SEGMENTS) {
    throw DisplayError::invalid_level(level);
  }

  bool ack = true;

  // Order matters: the address mode must be set before the register write,
  // and on/brightness is sent every time.
  ack = commands.set_fixed_address_mode() && ack;
  ack = commands.write_register(LEVEL_TAB[level]) && ack;
  ack = commands.set_display_on(current_brightness) && ack;

  return ack;
}

bool BatteryDisplay::clear_display() {
  return set_level(0);
}

bool BatteryDisplay::turn_off() {
  return commands.set_display_off();
}
