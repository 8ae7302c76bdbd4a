#include "tm1651_command.hpp"

#ifdef BATTERY_DISPLAY_DEBUG
#include <cstdio>
#endif


bool Tm1651CommandWriter::send_command(std::initializer_list<uint8_t> bytes) {
  bool ack = true;

  bus.start();
  for(uint8_t b : bytes) {
    // Keep writing after a missing ack so the frame is always complete.
    ack = bus.write_byte(b) && ack;
  }
  bus.stop();

#ifdef BATTERY_DISPLAY_DEBUG
  fprintf(stderr, "tm1651: send_command");
  for(uint8_t b : bytes) {
    fprintf(stderr, " 0x%02x", b);
  }
  fprintf(stderr, " ack=%d\n", ack ? 1 : 0);
#endif

  return ack;
}

bool Tm1651CommandWriter::set_fixed_address_mode() {
  return send_command({encode(Tm1651Command::ADDR_FIXED)});
}

bool Tm1651CommandWriter::write_register(uint8_t segments) {
  return send_command({encode(Tm1651Command::ADDR_START), segments});
}

bool Tm1651CommandWriter::set_display_on(int brightness) {
  return send_command({display_on_command(brightness)});
}

bool Tm1651CommandWriter::set_display_off() {
  return send_command({encode(Tm1651Command::DISPLAY_OFF)});
}
