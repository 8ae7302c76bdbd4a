#include "gpio_backend_pigpio.hpp"


GpioBackendPigpio::GpioBackendPigpio(const char* host, const char* port) {
  // pigpio API takes non-const strings but does not modify them.
  pigpio = pigpio_start(const_cast<char*>(host), const_cast<char*>(port));
  if(pigpio < 0) {
    throw std::runtime_error(std::string("Failed to connect to pigpiod (") + pigpio_error(pigpio) + ")");
  }
}

GpioBackendPigpio::~GpioBackendPigpio() {
  if(pigpio < 0) {
    return;
  }
  pigpio_stop(pigpio);
  pigpio = -1;
}

void GpioBackendPigpio::check(int ret, const char* what, unsigned int pin) {
  if(ret < 0) {
    throw std::runtime_error(std::string(what) + " failed on GPIO " + std::to_string(pin) + " (" + pigpio_error(ret) + ")");
  }
}

void GpioBackendPigpio::configure(unsigned int pin, PinMode mode, bool level) {
  if(mode == PinMode::INPUT) {
    check(set_mode(pigpio, pin, PI_INPUT), "set_mode", pin);
    return;
  }
  // Load the output latch first; set_mode(PI_OUTPUT) drives whatever it holds.
  check(gpio_write(pigpio, pin, level ? 1 : 0), "gpio_write", pin);
  check(set_mode(pigpio, pin, PI_OUTPUT), "set_mode", pin);
}

void GpioBackendPigpio::write(unsigned int pin, bool level) {
  check(gpio_write(pigpio, pin, level ? 1 : 0), "gpio_write", pin);
}

bool GpioBackendPigpio::read(unsigned int pin) {
  const int v = gpio_read(pigpio, pin);
  check(v, "gpio_read", pin);
  return v != 0;
}

void GpioBackendPigpio::release(unsigned int pin) {
  check(set_mode(pigpio, pin, PI_INPUT), "set_mode", pin);
}
