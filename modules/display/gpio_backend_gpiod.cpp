#include "gpio_backend_gpiod.hpp"

#include <cerrno>
#include <cstring>


GpioBackendGpiod::GpioBackendGpiod(const char* chip_path) {
  gpio_chip = gpiod_chip_open(chip_path);
  if(gpio_chip == nullptr) {
    throw std::runtime_error(std::string("Failed to open GPIO chip: ") + chip_path + " (" + std::strerror(errno) + ")");
  }
}

GpioBackendGpiod::~GpioBackendGpiod() {
  close_gpio();
}

struct gpiod_line_config* GpioBackendGpiod::new_line_config(unsigned int pin, PinMode mode, bool level) {
  gpiod_line_config* line_cfg = gpiod_line_config_new();
  gpiod_line_settings* settings = gpiod_line_settings_new();
  if(line_cfg == nullptr || settings == nullptr) {
    if(settings != nullptr) { gpiod_line_settings_free(settings); }
    if(line_cfg != nullptr) { gpiod_line_config_free(line_cfg); }
    throw std::runtime_error("Failed to allocate libgpiod configs");
  }

  if(mode == PinMode::OUTPUT) {
    gpiod_line_settings_set_direction(settings, GPIOD_LINE_DIRECTION_OUTPUT);
    gpiod_line_settings_set_output_value(settings, level ? GPIOD_LINE_VALUE_ACTIVE : GPIOD_LINE_VALUE_INACTIVE);
  } else {
    gpiod_line_settings_set_direction(settings, GPIOD_LINE_DIRECTION_INPUT);
  }

  unsigned int offsets[] = {pin};
  const int ret = gpiod_line_config_add_line_settings(line_cfg, offsets, 1, settings);
  gpiod_line_settings_free(settings);
  if(ret != 0) {
    gpiod_line_config_free(line_cfg);
    throw std::runtime_error("Failed to configure GPIO line " + std::to_string(pin));
  }
  return line_cfg;
}

struct gpiod_line_request* GpioBackendGpiod::request_for(unsigned int pin) {
  auto it = requests.find(pin);
  if(it == requests.end()) {
    throw std::runtime_error("GPIO line " + std::to_string(pin) + " is not initialized");
  }
  return it->second;
}

void GpioBackendGpiod::configure(unsigned int pin, PinMode mode, bool level) {
  // The output value is part of the line settings, so the kernel applies it
  // together with the direction change.
  gpiod_line_config* line_cfg = new_line_config(pin, mode, level);

  auto it = requests.find(pin);
  if(it != requests.end()) {
    const int ret = gpiod_line_request_reconfigure_lines(it->second, line_cfg);
    gpiod_line_config_free(line_cfg);
    if(ret != 0) {
      throw std::runtime_error("Failed to reconfigure GPIO line " + std::to_string(pin) + " (" + std::strerror(errno) + ")");
    }
    return;
  }

  gpiod_request_config* req_cfg = gpiod_request_config_new();
  if(req_cfg == nullptr) {
    gpiod_line_config_free(line_cfg);
    throw std::runtime_error("Failed to allocate libgpiod configs");
  }
  gpiod_request_config_set_consumer(req_cfg, BATTERY_DISPLAY_GPIO_CONSUMER);

  gpiod_line_request* request = gpiod_chip_request_lines(gpio_chip, req_cfg, line_cfg);
  gpiod_line_config_free(line_cfg);
  gpiod_request_config_free(req_cfg);

  if(request == nullptr) {
    throw std::runtime_error("Failed to request GPIO line " + std::to_string(pin) + " via libgpiod (" + std::strerror(errno) + ")");
  }
  requests[pin] = request;
}

void GpioBackendGpiod::write(unsigned int pin, bool level) {
  const enum gpiod_line_value v = level ? GPIOD_LINE_VALUE_ACTIVE : GPIOD_LINE_VALUE_INACTIVE;
  if(gpiod_line_request_set_value(request_for(pin), pin, v) != 0) {
    throw std::runtime_error("Failed to set GPIO line value on " + std::to_string(pin));
  }
}

bool GpioBackendGpiod::read(unsigned int pin) {
  const enum gpiod_line_value v = gpiod_line_request_get_value(request_for(pin), pin);
  if(v == GPIOD_LINE_VALUE_ERROR) {
    throw std::runtime_error("Failed to read GPIO line value on " + std::to_string(pin));
  }
  return v == GPIOD_LINE_VALUE_ACTIVE;
}

void GpioBackendGpiod::release(unsigned int pin) {
  auto it = requests.find(pin);
  if(it == requests.end()) {
    return;
  }
  // Releasing the request hands the line back to the kernel as it is;
  // switch it to input first so nothing is left driven.
  gpiod_line_config* line_cfg = new_line_config(pin, PinMode::INPUT, LINE_LOW);
  const int ret = gpiod_line_request_reconfigure_lines(it->second, line_cfg);
  gpiod_line_config_free(line_cfg);

  gpiod_line_request_release(it->second);
  requests.erase(it);

  if(ret != 0) {
    throw std::runtime_error("Failed to switch GPIO line " + std::to_string(pin) + " to input before release");
  }
}

void GpioBackendGpiod::close_gpio() {
  for(auto& r : requests) {
    gpiod_line_request_release(r.second);
  }
  requests.clear();
  if(gpio_chip != nullptr) {
    gpiod_chip_close(gpio_chip);
    gpio_chip = nullptr;
  }
}
