#include "gpio_backend.hpp"

#include <cstdio>
#include <exception>


GpioPin::GpioPin(GpioBackend& backend, unsigned int pin)
  : gpio(backend), offset(pin) {
}

GpioPin::~GpioPin() {
  if(!claimed) {
    return;
  }
  try {
    gpio.release(offset);
  } catch(const std::exception& e) {
    fprintf(stderr, "gpio: failed to release pin %u: %s\n", offset, e.what());
  }
}

void GpioPin::set_mode(PinMode mode, bool level) {
  gpio.configure(offset, mode, level);
  claimed = true;
}

void GpioPin::write(bool level) {
  gpio.write(offset, level);
}

bool GpioPin::read() {
  return gpio.read(offset);
}
