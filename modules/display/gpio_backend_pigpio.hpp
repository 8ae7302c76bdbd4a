#ifndef BATTERY_DISPLAY_GPIO_BACKEND_PIGPIO_HPP
#define BATTERY_DISPLAY_GPIO_BACKEND_PIGPIO_HPP

#include <stdexcept>
#include <string>

#include "gpio_backend.hpp"

#include <pigpiod_if2.h>

// pigpio daemon backend. nullptr host/port means PIGPIO_ADDR / PIGPIO_PORT
// from the environment, then localhost:8888.
class GpioBackendPigpio final : public GpioBackend {
  private:
    int pigpio = -1;

    void check(int ret, const char* what, unsigned int pin);

  public:
    explicit GpioBackendPigpio(const char* host = nullptr, const char* port = nullptr);
    ~GpioBackendPigpio() override;

    void configure(unsigned int pin, PinMode mode, bool level) override;
    void write(unsigned int pin, bool level) override;
    bool read(unsigned int pin) override;
    void release(unsigned int pin) override;
};

#endif
