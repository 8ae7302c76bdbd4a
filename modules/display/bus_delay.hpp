#ifndef BATTERY_DISPLAY_BUS_DELAY_HPP
#define BATTERY_DISPLAY_BUS_DELAY_HPP

// Time source for the bit-banged bus. Every phase of the protocol is a fixed
// wait, never a wait-for-condition.
class BusDelay {
  public:
    virtual ~BusDelay() = default;
    virtual void wait_ns(unsigned long ns) = 0;
};

class SleepBusDelay final : public BusDelay {
  public:
    void wait_ns(unsigned long ns) override;
};

#endif
