#ifndef BATTERY_DISPLAY_TWO_WIRE_BUS_HPP
#define BATTERY_DISPLAY_TWO_WIRE_BUS_HPP

#include <cstdint>

#include "bus_delay.hpp"
#include "gpio_backend.hpp"

// The TM1651/TM1637 tolerate up to 500 kHz on CLK. 50 us per bit keeps a wide
// margin on long jumper wires.
#ifndef BATTERY_DISPLAY_CLOCK_CYCLE_NS
#define BATTERY_DISPLAY_CLOCK_CYCLE_NS 50000
#endif

// Bit-banged TM1651 style two wire bus (CLK + DIO). Not I2C: no device
// address, bytes go LSB first and the chip acknowledges each byte by pulling
// DIO low during a ninth clock.
//
// The bus owns both lines for its lifetime. Nothing else may touch them.
class TwoWireBus {
  private:
    GpioPin clock;
    GpioPin data;
    BusDelay& delay;

    unsigned long QUARTER_CYCLE_NS;
    unsigned long HALF_CYCLE_NS;

    void half_cycle_clock_low(bool bit);
    void half_cycle_clock_high();
    bool half_cycle_clock_high_ack();
    void delineate_transmission(bool begin);

  public:
    TwoWireBus(GpioBackend& gpio, BusDelay& bus_delay, unsigned int clock_pin, unsigned int data_pin,
               unsigned long clock_cycle_ns = BATTERY_DISPLAY_CLOCK_CYCLE_NS);

    TwoWireBus(const TwoWireBus&) = delete;
    TwoWireBus& operator=(const TwoWireBus&) = delete;

    // Claim both lines as outputs.
    void setup();

    // DIO HIGH->LOW while CLK is HIGH.
    void start();
    // DIO LOW->HIGH while CLK is HIGH.
    void stop();

    // DIO may only change while CLK is LOW, otherwise the chip sees a
    // start or stop condition.
    void write_bit(bool bit);

    // Eight bits LSB first, then the ack clock. Returns true if the chip
    // pulled DIO low.
    bool write_byte(uint8_t byte);

    unsigned int clock_pin() const { return clock.pin(); }
    unsigned int data_pin() const { return data.pin(); }
};

#endif
