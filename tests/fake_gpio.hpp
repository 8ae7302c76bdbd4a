#ifndef BATTERY_DISPLAY_TESTS_FAKE_GPIO_HPP
#define BATTERY_DISPLAY_TESTS_FAKE_GPIO_HPP

#include <cstdint>
#include <map>
#include <vector>

#include "bus_delay.hpp"
#include "gpio_backend.hpp"

struct GpioEvent {
  enum Type { CONFIGURE, WRITE, READ, RELEASE };
  Type type;
  unsigned int pin;
  // WRITE/READ: the level, CONFIGURE: true for OUTPUT.
  bool value;

  bool operator==(const GpioEvent& o) const {
    return type == o.type && pin == o.pin && value == o.value;
  }
};

// One start ... stop transmission as seen by the chip.
struct BusFrame {
  std::vector<uint8_t> bytes;
  std::vector<bool> acks;
};

// In-memory GPIO with a TM1651 listening on one clock/data pair. It decodes
// start/stop conditions and bits at rising clock edges, and pulls DIO low in
// the ninth clock of every byte it accepts.
class FakeGpio : public GpioBackend {
  private:
    unsigned int clk_pin;
    unsigned int dio_pin;

    std::map<unsigned int, bool> outputs;  // pin -> is output
    std::map<unsigned int, bool> levels;

    bool in_frame = false;
    bool ack_slot = false;
    bool acking = false;
    int bit_count = 0;
    uint8_t shift = 0;
    int byte_index = 0;

    void on_clock(bool previous, bool level);
    void on_data(bool previous, bool level);
    void check_contention(unsigned int pin, bool driven);

  public:
    FakeGpio(unsigned int clock_pin, unsigned int data_pin) : clk_pin(clock_pin), dio_pin(data_pin) {}

    // Chip configuration.
    bool peer_present = true;
    // Byte index (counted over the whole run) the chip refuses to ack, -1 for none.
    int nack_byte = -1;

    std::vector<GpioEvent> events;
    std::vector<BusFrame> frames;
    // DIO at every rising CLK edge inside a frame, ack clocks excluded.
    std::vector<bool> sampled_bits;
    // write() on an input pin or read() on an output pin.
    int misuse = 0;
    // Times DIO was driven HIGH as an output while the chip pulled it LOW.
    int contention = 0;

    int configure_calls() const;
    bool level(unsigned int pin) const;
    bool is_output(unsigned int pin) const;
    bool in_transmission() const { return in_frame; }

    void configure(unsigned int pin, PinMode mode, bool level) override;
    void write(unsigned int pin, bool level) override;
    bool read(unsigned int pin) override;
    void release(unsigned int pin) override;
};

// Records the requested waits instead of sleeping.
class RecordingDelay : public BusDelay {
  public:
    std::vector<unsigned long> waits;

    void wait_ns(unsigned long ns) override { waits.push_back(ns); }
    unsigned long long total() const;
};

#endif
