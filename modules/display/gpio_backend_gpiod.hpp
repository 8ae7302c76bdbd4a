#ifndef BATTERY_DISPLAY_GPIO_BACKEND_GPIOD_HPP
#define BATTERY_DISPLAY_GPIO_BACKEND_GPIOD_HPP

#include <map>
#include <stdexcept>
#include <string>

#include "gpio_backend.hpp"

#include <gpiod.h>

// Device paths (compile-time overrides are supported).
#ifndef BATTERY_DISPLAY_GPIOCHIP_PATH
#define BATTERY_DISPLAY_GPIOCHIP_PATH "/dev/gpiochip0"
#endif

#ifndef BATTERY_DISPLAY_GPIO_CONSUMER
#define BATTERY_DISPLAY_GPIO_CONSUMER "battery_display"
#endif

// libgpiod v2 backend. Each pin gets its own line request so a direction
// change only reconfigures that line.
class GpioBackendGpiod final : public GpioBackend {
  private:
    struct gpiod_chip* gpio_chip = nullptr;
    std::map<unsigned int, struct gpiod_line_request*> requests;

    struct gpiod_line_config* new_line_config(unsigned int pin, PinMode mode, bool level);
    struct gpiod_line_request* request_for(unsigned int pin);
    void close_gpio();

  public:
    explicit GpioBackendGpiod(const char* chip_path = BATTERY_DISPLAY_GPIOCHIP_PATH);
    ~GpioBackendGpiod() override;

    void configure(unsigned int pin, PinMode mode, bool level) override;
    void write(unsigned int pin, bool level) override;
    bool read(unsigned int pin) override;
    void release(unsigned int pin) override;
};

#endif
