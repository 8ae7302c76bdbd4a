#ifndef BATTERY_DISPLAY_GPIO_BACKEND_HPP
#define BATTERY_DISPLAY_GPIO_BACKEND_HPP

// GPIO.BCM numbering, 0..27 on the 40 pin header.
#define GPIO_PIN_MIN 0
#define GPIO_PIN_MAX 27

enum class PinMode {
  OUTPUT,
  INPUT,
};

// Line levels as seen by the bus. true is HIGH.
constexpr bool LINE_HIGH = true;
constexpr bool LINE_LOW = false;

// Pin control capability. Implementations map BCM pin numbers to whatever
// the underlying library uses (pigpio daemon, gpiochip line offsets, a test
// double). write() on an input pin and read() on an output pin are undefined.
//
// configure() to OUTPUT puts `level` on the line before it starts driving,
// so a pin never briefly drives a stale level. `level` is ignored for INPUT.
class GpioBackend {
  public:
    GpioBackend() = default;
    virtual ~GpioBackend() = default;

    GpioBackend(const GpioBackend&) = delete;
    GpioBackend& operator=(const GpioBackend&) = delete;

    virtual void configure(unsigned int pin, PinMode mode, bool level) = 0;
    virtual void write(unsigned int pin, bool level) = 0;
    virtual bool read(unsigned int pin) = 0;

    // Give the line back (input, no longer claimed by this process).
    virtual void release(unsigned int pin) = 0;
};

// Exclusive handle on one line of a backend. Not copyable: two handles on the
// same line would drive it from two places. The line is released when the
// handle goes away.
class GpioPin {
  private:
    GpioBackend& gpio;
    unsigned int offset;
    bool claimed = false;

  public:
    GpioPin(GpioBackend& backend, unsigned int pin);
    ~GpioPin();

    GpioPin(const GpioPin&) = delete;
    GpioPin& operator=(const GpioPin&) = delete;

    unsigned int pin() const { return offset; }

    void set_mode(PinMode mode, bool level = LINE_LOW);
    void write(bool level);
    bool read();
};

#endif
