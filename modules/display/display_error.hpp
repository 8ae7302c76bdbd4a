#ifndef BATTERY_DISPLAY_DISPLAY_ERROR_HPP
#define BATTERY_DISPLAY_DISPLAY_ERROR_HPP

#include <stdexcept>
#include <string>

enum class DisplayErrorKind {
  InvalidPin,
  InvalidBrightness,
  InvalidLevel,
  InvalidSegmentCount,
  NoDeviceFound,
};

const char* to_string(DisplayErrorKind kind);

// Raised by BatteryDisplay on bad arguments and when no chip answers at
// construction. Hardware access failures stay plain std::runtime_error.
class DisplayError : public std::runtime_error {
  private:
    DisplayErrorKind error_kind;
    int error_value;
    unsigned int error_clock_pin = 0;
    unsigned int error_data_pin = 0;

  public:
    DisplayError(DisplayErrorKind kind, int value, const std::string& message);

    static DisplayError invalid_pin(int pin);
    static DisplayError invalid_brightness(int brightness);
    static DisplayError invalid_level(int level);
    static DisplayError invalid_segment_count(int segments);
    static DisplayError no_device_found(unsigned int clock_pin, unsigned int data_pin);

    DisplayErrorKind kind() const { return error_kind; }
    // The rejected pin, brightness, level or segment count.
    int value() const { return error_value; }
    unsigned int clock_pin() const { return error_clock_pin; }
    unsigned int data_pin() const { return error_data_pin; }
};

#endif
