#ifndef BATTERY_DISPLAY_CLI_HPP
#define BATTERY_DISPLAY_CLI_HPP

#include <cstdio>

#include "battery_display.hpp"
#include "display_error.hpp"

#ifndef BATTERY_DISPLAY_CPU_INTERVAL_S
#define BATTERY_DISPLAY_CPU_INTERVAL_S 2
#endif

// Exit codes of the battery-display tool.
#define EXIT_INVALID_PIN 1
#define EXIT_INVALID_BRIGHTNESS 2
#define EXIT_INVALID_LEVEL 3
#define EXIT_NO_DEVICE_FOUND 4
#define EXIT_INVALID_SEGMENTS 5
#define EXIT_BACKEND_FAILURE 6
#define EXIT_USAGE 64

struct CliOptions {
  int clock_pin = BATTERY_DISPLAY_DEFAULT_CLOCK_PIN;
  int data_pin = BATTERY_DISPLAY_DEFAULT_DATA_PIN;
  int brightness = static_cast<int>(Brightness::DARK);
  int segments = BATTERY_DISPLAY_DEFAULT_SEGMENTS;
  bool has_level = false;
  int level = 0;
  bool processor = false;
};

void usage(FILE* out, const char* prog);

// Decimal int, whole string, no overflow.
bool parse_int(const char* s, int* out);

// Parses argv into opts. Returns -1 when the tool should go on, otherwise the
// exit code (0 after --help). Help goes to out, diagnostics to err. Value
// ranges are left to BatteryDisplay. Can be called more than once per process.
int parse_options(int argc, char** argv, CliOptions* opts, FILE* out, FILE* err);

int exit_code(DisplayErrorKind kind);

// Prints the user-facing message for error to out and returns its exit code.
int report(FILE* out, const DisplayError& error);

// SIGINT and SIGTERM only raise a flag, so the display is always released by
// its destructor.
void install_signal_handlers();
bool quit_requested();

#endif
