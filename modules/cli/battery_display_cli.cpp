#include "battery_display_cli.hpp"

#include <getopt.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <climits>
#include <cstdlib>


namespace {

std::atomic<bool> status_quit{false};

void handle_signal(int) {
  status_quit.store(true);
}

}  // namespace

void install_signal_handlers() {
  struct sigaction sa;
  sa.sa_handler = handle_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool quit_requested() {
  return status_quit.load();
}

void usage(FILE* out, const char* prog) {
  fprintf(out,
    "usage: %s [-c PIN] [-d PIN] [-b BRIGHTNESS] [-s SEGMENTS] (-l LEVEL | -p)\n"
    "\n"
    "Control a mini battery display with TM1651 or TM1637 chip\n"
    "\n"
    "  -c, --clock-pin PIN    Clock pin in BCM notation (default: %d, range: 0-27)\n"
    "  -d, --data-pin PIN     Data pin in BCM notation (default: %d, range: 0-27)\n"
    "  -b, --brightness N     Brightness (default: %d, range: 0-7)\n"
    "  -s, --segments N       Number of LED segments (default: %d, range: 1-8)\n"
    "  -l, --level N          Set battery level (range: 0 to segments-1)\n"
    "  -p, --processor        Show CPU percentage, updated every %d s\n"
    "  -h, --help             Show this help\n",
    prog, BATTERY_DISPLAY_DEFAULT_CLOCK_PIN, BATTERY_DISPLAY_DEFAULT_DATA_PIN,
    static_cast<int>(Brightness::DARK), BATTERY_DISPLAY_DEFAULT_SEGMENTS, BATTERY_DISPLAY_CPU_INTERVAL_S);
}

bool parse_int(const char* s, int* out) {
  char* end = nullptr;
  errno = 0;
  const long v = strtol(s, &end, 10);
  if(errno != 0 || end == s || *end != '\0' || v < INT_MIN || v > INT_MAX) {
    return false;
  }
  *out = static_cast<int>(v);
  return true;
}

int parse_options(int argc, char** argv, CliOptions* opts, FILE* out, FILE* err) {
  static const struct option long_options[] = {
    {"clock-pin", required_argument, nullptr, 'c'},
    {"data-pin", required_argument, nullptr, 'd'},
    {"brightness", required_argument, nullptr, 'b'},
    {"segments", required_argument, nullptr, 's'},
    {"level", required_argument, nullptr, 'l'},
    {"processor", no_argument, nullptr, 'p'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
  };

  // 0 makes glibc's getopt start over; diagnostics are ours.
  optind = 0;
  opterr = 0;

  int c;
  while((c = getopt_long(argc, argv, "c:d:b:s:l:ph", long_options, nullptr)) != -1) {
    int* target = nullptr;
    switch(c) {
      case 'c': target = &opts->clock_pin; break;
      case 'd': target = &opts->data_pin; break;
      case 'b': target = &opts->brightness; break;
      case 's': target = &opts->segments; break;
      case 'l': target = &opts->level; opts->has_level = true; break;
      case 'p': opts->processor = true; break;
      case 'h':
        usage(out, argv[0]);
        return 0;
      default:
        fprintf(err, "%s: invalid option or missing value: '%s'\n", argv[0], argv[optind - 1]);
        usage(err, argv[0]);
        return EXIT_USAGE;
    }
    if(target != nullptr && !parse_int(optarg, target)) {
      fprintf(err, "%s: invalid integer value: '%s'\n", argv[0], optarg);
      usage(err, argv[0]);
      return EXIT_USAGE;
    }
  }

  if(optind < argc) {
    fprintf(err, "%s: unrecognized arguments: %s\n", argv[0], argv[optind]);
    usage(err, argv[0]);
    return EXIT_USAGE;
  }
  if(opts->has_level == opts->processor) {
    fprintf(err, "%s: exactly one of the arguments -l/--level -p/--processor is required\n", argv[0]);
    usage(err, argv[0]);
    return EXIT_USAGE;
  }
  return -1;
}

int exit_code(DisplayErrorKind kind) {
  switch(kind) {
    case DisplayErrorKind::InvalidPin: return EXIT_INVALID_PIN;
    case DisplayErrorKind::InvalidBrightness: return EXIT_INVALID_BRIGHTNESS;
    case DisplayErrorKind::InvalidLevel: return EXIT_INVALID_LEVEL;
    case DisplayErrorKind::NoDeviceFound: return EXIT_NO_DEVICE_FOUND;
    case DisplayErrorKind::InvalidSegmentCount: return EXIT_INVALID_SEGMENTS;
  }
  return EXIT_FAILURE;
}

int report(FILE* out, const DisplayError& error) {
  switch(error.kind()) {
    case DisplayErrorKind::InvalidPin:
      fprintf(out, "Invalid pin number: %d. %s\n", error.value(), error.what());
      break;
    case DisplayErrorKind::InvalidBrightness:
      fprintf(out, "Invalid brightness: %d. %s\n", error.value(), error.what());
      break;
    case DisplayErrorKind::InvalidLevel:
      fprintf(out, "Invalid level: %d. %s\n", error.value(), error.what());
      break;
    case DisplayErrorKind::NoDeviceFound:
      fprintf(out, "No display found on clock pin %u and data pin %u.\n", error.clock_pin(), error.data_pin());
      break;
    case DisplayErrorKind::InvalidSegmentCount:
      fprintf(out, "Invalid number of segments: %d. %s\n", error.value(), error.what());
      break;
  }
  return exit_code(error.kind());
}
