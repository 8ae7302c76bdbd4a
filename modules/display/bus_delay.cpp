#include "bus_delay.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>


void SleepBusDelay::wait_ns(unsigned long ns) {
  struct timespec req;
  req.tv_sec = static_cast<time_t>(ns / 1000000000UL);
  req.tv_nsec = static_cast<long>(ns % 1000000000UL);

  struct timespec rem;
  int ret = 0;
  do {
    ret = ::nanosleep(&req, &rem);
    req = rem;
  } while(ret < 0 && errno == EINTR);

  if(ret < 0) {
    throw std::runtime_error(std::string("nanosleep failed (") + std::strerror(errno) + ")");
  }
}
