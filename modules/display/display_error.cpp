#include "display_error.hpp"


const char* to_string(DisplayErrorKind kind) {
  switch(kind) {
    case DisplayErrorKind::InvalidPin:
      return "InvalidPin";
    case DisplayErrorKind::InvalidBrightness:
      return "InvalidBrightness";
    case DisplayErrorKind::InvalidLevel:
      return "InvalidLevel";
    case DisplayErrorKind::InvalidSegmentCount:
      return "InvalidSegmentCount";
    case DisplayErrorKind::NoDeviceFound:
      return "NoDeviceFound";
  }
  return "Unknown";
}

DisplayError::DisplayError(DisplayErrorKind kind, int value, const std::string& message)
  : std::runtime_error(message), error_kind(kind), error_value(value) {
}

DisplayError DisplayError::invalid_pin(int pin) {
  return DisplayError(DisplayErrorKind::InvalidPin, pin, "Pin should be a number from 0 to 27.");
}

DisplayError DisplayError::invalid_brightness(int brightness) {
  return DisplayError(DisplayErrorKind::InvalidBrightness, brightness, "Brightness should be a number from 0 to 7.");
}

DisplayError DisplayError::invalid_level(int level) {
  return DisplayError(DisplayErrorKind::InvalidLevel, level,
                      "Level should be a number from 0 to the number of LED segments minus one.");
}

DisplayError DisplayError::invalid_segment_count(int segments) {
  return DisplayError(DisplayErrorKind::InvalidSegmentCount, segments,
                      "Number of LED segments should be a number from 1 to 8.");
}

DisplayError DisplayError::no_device_found(unsigned int clock_pin, unsigned int data_pin) {
  DisplayError e(DisplayErrorKind::NoDeviceFound, 0, "No display found.");
  e.error_clock_pin = clock_pin;
  e.error_data_pin = data_pin;
  return e;
}
