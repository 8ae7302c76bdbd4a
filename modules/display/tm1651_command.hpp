#ifndef BATTERY_DISPLAY_TM1651_COMMAND_HPP
#define BATTERY_DISPLAY_TM1651_COMMAND_HPP

#include <cstdint>
#include <initializer_list>

#include "two_wire_bus.hpp"

enum class Tm1651Command : uint8_t {
  // data command
  ADDR_FIXED = 0x44,
  // display control commands, brightness is added to DISPLAY_ON
  DISPLAY_OFF = 0x80,
  DISPLAY_ON = 0x88,
  // address command, GRID1
  ADDR_START = 0xC0,
};

// 0 is the dimmest setting, not off.
enum class Brightness : int {
  DARKEST = 0,
  DARKER = 1,
  DARK = 2,
  TYPICAL = 3,
  SEMI_BRIGHT = 4,
  BRIGHT = 5,
  BRIGHTER = 6,
  BRIGHTEST = 7,
};

constexpr uint8_t encode(Tm1651Command command) {
  return static_cast<uint8_t>(command);
}

constexpr uint8_t display_on_command(int brightness) {
  return static_cast<uint8_t>(encode(Tm1651Command::DISPLAY_ON) + brightness);
}

// Frames TM1651 commands on the bus. Every call is one start ... stop
// transmission; the result is true only if every byte in it was acked.
class Tm1651CommandWriter {
  private:
    TwoWireBus& bus;

  public:
    explicit Tm1651CommandWriter(TwoWireBus& two_wire_bus) : bus(two_wire_bus) {}

    bool send_command(std::initializer_list<uint8_t> bytes);

    bool set_fixed_address_mode();
    bool write_register(uint8_t segments);
    bool set_display_on(int brightness);
    bool set_display_off();
};

#endif
