#include <unistd.h>

#include <cstdio>
#include <stdexcept>

#include "battery_display.hpp"
#include "battery_display_cli.hpp"
#include "bus_delay.hpp"
#include "cpu_load.hpp"
#include "gpio_backend_default.hpp"

namespace {

void show_level(BatteryDisplay& display, int level) {
  if(!display.set_level(level)) {
    fprintf(stderr, "battery_display: level %d was not acknowledged by the display\n", level);
  }
}

void show_processor(BatteryDisplay& display) {
  CpuLoadSampler sampler;
  sampler.sample();

  while(!quit_requested()) {
    for(int i = 0; i < BATTERY_DISPLAY_CPU_INTERVAL_S * 10 && !quit_requested(); i++) {
      usleep(100000);
    }
    if(quit_requested()) {
      break;
    }
    show_level(display, cpu_load_to_level(sampler.sample(), display.segments()));
  }
}

}  // namespace

int main(int argc, char** argv) {
  // Before any line is claimed, so an interrupt never skips the release below.
  install_signal_handlers();

  CliOptions opts;
  const int parsed = parse_options(argc, argv, &opts, stdout, stderr);
  if(parsed >= 0) {
    return parsed;
  }

  // Lines claimed by the display are released when it goes out of scope,
  // on every path below.
  try {
    DefaultGpioBackend gpio;
    SleepBusDelay delay;
    BatteryDisplay display(gpio, delay, opts.clock_pin, opts.data_pin, opts.segments);
    display.set_brightness(opts.brightness);

    if(opts.has_level) {
      show_level(display, opts.level);
    } else {
      show_processor(display);
    }
  } catch(const DisplayError& e) {
    return report(stdout, e);
  } catch(const std::runtime_error& e) {
    fprintf(stderr, "battery_display: %s\n", e.what());
    return EXIT_BACKEND_FAILURE;
  }
  return 0;
}
