#ifndef BATTERY_DISPLAY_CPU_LOAD_HPP
#define BATTERY_DISPLAY_CPU_LOAD_HPP

#include <string>

#ifndef BATTERY_DISPLAY_PROC_STAT_PATH
#define BATTERY_DISPLAY_PROC_STAT_PATH "/proc/stat"
#endif

struct CpuTimes {
  unsigned long long idle = 0;
  unsigned long long total = 0;
};

// Parses the aggregate "cpu ..." line of /proc/stat. idle includes iowait,
// total excludes guest time (already counted in user/nice).
bool parse_cpu_times(const std::string& line, CpuTimes* out);

// Busy percentage between two readings. 0 if no time has passed.
double cpu_load_percent(const CpuTimes& previous, const CpuTimes& current);

// 0..100 % mapped onto 0..segments-1 bars.
int cpu_load_to_level(double percent, int segments);

class CpuLoadSampler {
  private:
    std::string stat_path;
    CpuTimes previous;
    bool has_previous = false;

    CpuTimes read_times();

  public:
    explicit CpuLoadSampler(const std::string& path = BATTERY_DISPLAY_PROC_STAT_PATH);

    // Load since the previous call. The first call only primes the sampler
    // and returns 0.
    double sample();
};

#endif
