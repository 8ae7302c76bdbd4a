#include "cpu_load.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>


bool parse_cpu_times(const std::string& line, CpuTimes* out) {
  if(line.compare(0, 4, "cpu ") != 0) {
    return false;
  }

  unsigned long long v[8] = {0};
  const int n = sscanf(line.c_str() + 4, "%llu %llu %llu %llu %llu %llu %llu %llu",
                       &v[0], &v[1], &v[2], &v[3], &v[4], &v[5], &v[6], &v[7]);
  // user nice system idle are present on every kernel we care about
  if(n < 4) {
    return false;
  }

  CpuTimes t;
  for(int i = 0; i < n; i++) {
    t.total += v[i];
  }
  t.idle = v[3] + (n > 4 ? v[4] : 0);
  *out = t;
  return true;
}

double cpu_load_percent(const CpuTimes& previous, const CpuTimes& current) {
  if(current.total <= previous.total) {
    return 0.0;
  }
  const double total = static_cast<double>(current.total - previous.total);
  const double idle = current.idle >= previous.idle ? static_cast<double>(current.idle - previous.idle) : 0.0;
  double percent = 100.0 * (1.0 - idle / total);
  if(percent < 0.0) {
    percent = 0.0;
  } else if(percent > 100.0) {
    percent = 100.0;
  }
  return percent;
}

int cpu_load_to_level(double percent, int segments) {
  if(segments <= 0) {
    return 0;
  }
  int level = static_cast<int>(percent / 100.0 * segments);
  if(level >= segments) {
    level = segments - 1;
  } else if(level < 0) {
    level = 0;
  }
  return level;
}

CpuLoadSampler::CpuLoadSampler(const std::string& path) : stat_path(path) {
}

CpuTimes CpuLoadSampler::read_times() {
  FILE* fp = fopen(stat_path.c_str(), "r");
  if(fp == nullptr) {
    throw std::runtime_error("Failed to open " + stat_path + " (" + std::strerror(errno) + ")");
  }
  char buf[512];
  const bool got_line = fgets(buf, sizeof(buf), fp) != nullptr;
  fclose(fp);

  CpuTimes t;
  if(!got_line || !parse_cpu_times(buf, &t)) {
    throw std::runtime_error("Unexpected format in " + stat_path);
  }
  return t;
}

double CpuLoadSampler::sample() {
  const CpuTimes current = read_times();
  double percent = 0.0;
  if(has_previous) {
    percent = cpu_load_percent(previous, current);
  }
  previous = current;
  has_previous = true;
  return percent;
}
