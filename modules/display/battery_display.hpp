#ifndef BATTERY_DISPLAY_BATTERY_DISPLAY_HPP
#define BATTERY_DISPLAY_BATTERY_DISPLAY_HPP

#include <cstdint>

#include "bus_delay.hpp"
#include "display_error.hpp"
#include "gpio_backend.hpp"
#include "tm1651_command.hpp"
#include "two_wire_bus.hpp"

// GPIO.BCM
#ifndef BATTERY_DISPLAY_DEFAULT_CLOCK_PIN
#define BATTERY_DISPLAY_DEFAULT_CLOCK_PIN 24  // 18pin
#endif
#ifndef BATTERY_DISPLAY_DEFAULT_DATA_PIN
#define BATTERY_DISPLAY_DEFAULT_DATA_PIN 23  // 16pin
#endif
#ifndef BATTERY_DISPLAY_DEFAULT_SEGMENTS
#define BATTERY_DISPLAY_DEFAULT_SEGMENTS 7
#endif

#define BATTERY_DISPLAY_MAX_SEGMENTS 8
#define BATTERY_DISPLAY_MAX_BRIGHTNESS 7

// Mini battery level display driven by a TM1651 or TM1637.
//
// SEG1..SEG7/SEG8 of the chip drive the bars, only GRID1 is wired, so the
// whole display is one register holding a bar mask.
//
// Construction probes for the chip by clearing the display. If no byte of
// that clear is acknowledged, the constructor throws NoDeviceFound and both
// lines are released again.
class BatteryDisplay {
  private:
    const int SEGMENTS;
    TwoWireBus bus;
    Tm1651CommandWriter commands;
    int current_brightness = static_cast<int>(Brightness::DARK);

    static int validate(int clock_pin, int data_pin, int segments);

  public:
    BatteryDisplay(GpioBackend& gpio, BusDelay& delay,
                   int clock_pin = BATTERY_DISPLAY_DEFAULT_CLOCK_PIN,
                   int data_pin = BATTERY_DISPLAY_DEFAULT_DATA_PIN,
                   int segments = BATTERY_DISPLAY_DEFAULT_SEGMENTS,
                   unsigned long clock_cycle_ns = BATTERY_DISPLAY_CLOCK_CYCLE_NS);

    BatteryDisplay(const BatteryDisplay&) = delete;
    BatteryDisplay& operator=(const BatteryDisplay&) = delete;

    // Mask with the low `level` bits set. level must be 0..7.
    static uint8_t level_mask(int level);

    // Takes effect with the next set_level().
    void set_brightness(int brightness);
    int brightness() const { return current_brightness; }

    int segments() const { return SEGMENTS; }

    // Fixed address mode, bar mask, display on with the stored brightness.
    // Returns true if every byte was acknowledged.
    bool set_level(int level);
    bool clear_display();
    bool turn_off();
};

#endif
