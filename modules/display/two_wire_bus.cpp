#include "two_wire_bus.hpp"


TwoWireBus::TwoWireBus(GpioBackend& gpio, BusDelay& bus_delay, unsigned int clock_pin, unsigned int data_pin,
                       unsigned long clock_cycle_ns)
  : clock(gpio, clock_pin),
    data(gpio, data_pin),
    delay(bus_delay),
    QUARTER_CYCLE_NS(clock_cycle_ns / 4),
    HALF_CYCLE_NS(clock_cycle_ns / 2) {
}

void TwoWireBus::setup() {
  clock.set_mode(PinMode::OUTPUT);
  data.set_mode(PinMode::OUTPUT);
}

void TwoWireBus::half_cycle_clock_low(bool bit) {
  clock.write(LINE_LOW);
  delay.wait_ns(QUARTER_CYCLE_NS);

  data.write(bit);
  delay.wait_ns(QUARTER_CYCLE_NS);
}

void TwoWireBus::half_cycle_clock_high() {
  clock.write(LINE_HIGH);
  delay.wait_ns(HALF_CYCLE_NS);
}

bool TwoWireBus::half_cycle_clock_high_ack() {
  clock.write(LINE_HIGH);
  delay.wait_ns(QUARTER_CYCLE_NS);

  data.set_mode(PinMode::INPUT);
  const bool level = data.read();
  // The chip keeps DIO low until CLK falls. Take the line back at the level
  // just sampled so the output never drives against it.
  data.set_mode(PinMode::OUTPUT, level);

  delay.wait_ns(QUARTER_CYCLE_NS);
  clock.write(LINE_LOW);

  return level == LINE_LOW;
}

void TwoWireBus::delineate_transmission(bool begin) {
  data.write(begin);
  delay.wait_ns(HALF_CYCLE_NS);

  clock.write(LINE_HIGH);
  delay.wait_ns(QUARTER_CYCLE_NS);

  data.write(!begin);
  delay.wait_ns(QUARTER_CYCLE_NS);
}

void TwoWireBus::start() {
  delineate_transmission(LINE_HIGH);
}

void TwoWireBus::stop() {
  delineate_transmission(LINE_LOW);
}

void TwoWireBus::write_bit(bool bit) {
  half_cycle_clock_low(bit);
  half_cycle_clock_high();
}

bool TwoWireBus::write_byte(uint8_t byte) {
  for(int i = 0; i < 8; i++) {
    write_bit(byte & 0x01);
    byte >>= 1;
  }

  // Ninth clock: release DIO (HIGH) while CLK is low, sample it while CLK is high.
  half_cycle_clock_low(LINE_HIGH);
  return half_cycle_clock_high_ack();
}
