#include <gtest/gtest.h>

#include <vector>

#include "fake_gpio.hpp"
#include "tm1651_command.hpp"

namespace {

const unsigned int CLK = 5;
const unsigned int DIO = 6;

class Tm1651CommandTest : public ::testing::Test {
  protected:
    FakeGpio gpio{CLK, DIO};
    RecordingDelay delay;
    TwoWireBus bus{gpio, delay, CLK, DIO};
    Tm1651CommandWriter commands{bus};

    void SetUp() override {
      bus.setup();
    }
};

}  // namespace

TEST(Tm1651CommandBytes, MatchDatasheetValues) {
  EXPECT_EQ(encode(Tm1651Command::ADDR_FIXED), 0x44);
  EXPECT_EQ(encode(Tm1651Command::DISPLAY_OFF), 0x80);
  EXPECT_EQ(encode(Tm1651Command::DISPLAY_ON), 0x88);
  EXPECT_EQ(encode(Tm1651Command::ADDR_START), 0xC0);
}

TEST(Tm1651CommandBytes, DisplayOnAddsBrightness) {
  EXPECT_EQ(display_on_command(static_cast<int>(Brightness::DARKEST)), 0x88);
  EXPECT_EQ(display_on_command(static_cast<int>(Brightness::TYPICAL)), 0x8B);
  EXPECT_EQ(display_on_command(static_cast<int>(Brightness::BRIGHTEST)), 0x8F);
}

TEST_F(Tm1651CommandTest, SendCommandFramesAllBytesInOneTransmission) {
  EXPECT_TRUE(commands.send_command({0xC0, 0x1F}));

  ASSERT_EQ(gpio.frames.size(), 1u);
  EXPECT_EQ(gpio.frames[0].bytes, (std::vector<uint8_t>{0xC0, 0x1F}));
  EXPECT_EQ(gpio.frames[0].acks, (std::vector<bool>{true, true}));
  EXPECT_FALSE(gpio.in_transmission());
}

TEST_F(Tm1651CommandTest, OneMissingAckFailsTheWholeCommand) {
  gpio.nack_byte = 0;
  EXPECT_FALSE(commands.send_command({0xC0, 0x1F}));

  // The second byte is still sent and the frame is closed.
  ASSERT_EQ(gpio.frames.size(), 1u);
  EXPECT_EQ(gpio.frames[0].bytes, (std::vector<uint8_t>{0xC0, 0x1F}));
  EXPECT_EQ(gpio.frames[0].acks, (std::vector<bool>{false, true}));
  EXPECT_FALSE(gpio.in_transmission());
}

TEST_F(Tm1651CommandTest, NoChipNoAck) {
  gpio.peer_present = false;
  EXPECT_FALSE(commands.set_fixed_address_mode());
  ASSERT_EQ(gpio.frames.size(), 1u);
  EXPECT_EQ(gpio.frames[0].bytes, (std::vector<uint8_t>{0x44}));
}

TEST_F(Tm1651CommandTest, EachCommandIsItsOwnFrame) {
  EXPECT_TRUE(commands.set_fixed_address_mode());
  EXPECT_TRUE(commands.write_register(0b00000111));
  EXPECT_TRUE(commands.set_display_on(4));
  EXPECT_TRUE(commands.set_display_off());

  ASSERT_EQ(gpio.frames.size(), 4u);
  EXPECT_EQ(gpio.frames[0].bytes, (std::vector<uint8_t>{0x44}));
  EXPECT_EQ(gpio.frames[1].bytes, (std::vector<uint8_t>{0xC0, 0x07}));
  EXPECT_EQ(gpio.frames[2].bytes, (std::vector<uint8_t>{0x8C}));
  EXPECT_EQ(gpio.frames[3].bytes, (std::vector<uint8_t>{0x80}));
}

TEST_F(Tm1651CommandTest, CommandWithoutBytesIsJustStartAndStop) {
  EXPECT_TRUE(commands.send_command({}));
  ASSERT_EQ(gpio.frames.size(), 1u);
  EXPECT_TRUE(gpio.frames[0].bytes.empty());
}
