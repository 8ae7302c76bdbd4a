#ifndef BATTERY_DISPLAY_GPIO_BACKEND_DEFAULT_HPP
#define BATTERY_DISPLAY_GPIO_BACKEND_DEFAULT_HPP

// Select the implementation backend at build time.
// Exactly one backend macro must be defined by the build.
#if defined(BATTERY_DISPLAY_GPIO_BACKEND_PIGPIO)
#include "gpio_backend_pigpio.hpp"
typedef GpioBackendPigpio DefaultGpioBackend;
#elif defined(BATTERY_DISPLAY_GPIO_BACKEND_GPIOD)
#include "gpio_backend_gpiod.hpp"
typedef GpioBackendGpiod DefaultGpioBackend;
#else
#error "Define BATTERY_DISPLAY_GPIO_BACKEND_PIGPIO or BATTERY_DISPLAY_GPIO_BACKEND_GPIOD"
#endif

#endif
