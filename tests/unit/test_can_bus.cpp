#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "can_bus_base.hpp"
#include "mock_can_bus.hpp"
#include "test_helpers.hpp"

using namespace robomaster;
using namespace robomaster::testing;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

// ═══════════════════════════════════════════════════════════════════════════
// Twist Echo Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST(TwistEchoTest, ParsesCounterLittleEndian) {
  ExpectOptionalEq(ParseTwistEcho(MakeTwistEcho(0x1234)), uint16_t{0x1234});
}

TEST(TwistEchoTest, IgnoresExtendedFrame) {
  auto frame = MakeTwistEcho(5);
  frame.extended = true;
  ExpectOptionalEmpty(ParseTwistEcho(frame));
}

TEST(TwistEchoTest, IgnoresOtherIdentifier) {
  auto frame = MakeTwistEcho(5);
  frame.id = 0x202;
  ExpectOptionalEmpty(ParseTwistEcho(frame));
}

TEST(TwistEchoTest, IgnoresShortFrame) {
  ExpectOptionalEmpty(
      ParseTwistEcho(MakeFrame({0x55, 0x1b, 0x04, 0x75, 0x09, 0xc3, 0x05})));
}

TEST(TwistEchoTest, IgnoresWrongPrefix) {
  ExpectOptionalEmpty(ParseTwistEcho(
      MakeFrame({0x55, 0x14, 0x04, 0x6d, 0x09, 0x04, 0x05, 0x00})));
}

// ═══════════════════════════════════════════════════════════════════════════
// Open / Close
// ═══════════════════════════════════════════════════════════════════════════

class CanBusTest : public ::testing::Test {
 protected:
  void SetUp() override {
    log_ = std::make_shared<FakeCanBus::Log>();
    bus_ = std::make_unique<FakeCanBus>(log_);
  }

  void OpenBus() { ASSERT_TRUE(IsOk(bus_->Open("can0"))); }

  std::shared_ptr<FakeCanBus::Log> log_;
  std::unique_ptr<FakeCanBus> bus_;
};

TEST_F(CanBusTest, OpenRecordsInterface) {
  OpenBus();
  EXPECT_TRUE(bus_->IsOpen());
  EXPECT_EQ(bus_->InterfaceName(), "can0");
  EXPECT_EQ(log_->opened_interfaces, std::vector<std::string>{"can0"});
}

TEST_F(CanBusTest, OpenFailureCarriesInterfaceAndErrno) {
  log_->open_error = ENODEV;
  auto result = bus_->Open("can7");

  ExpectErrorCode(result, ErrorCode::OpenFailed);
  EXPECT_EQ(GetError(result).os_error, ENODEV);
  EXPECT_EQ(GetError(result).detail, "can7");
  EXPECT_FALSE(bus_->IsOpen());
}

TEST_F(CanBusTest, ReopenClosesPreviousHandle) {
  OpenBus();
  ASSERT_TRUE(IsOk(bus_->Open("can1")));

  EXPECT_EQ(log_->close_count, 1);
  EXPECT_EQ(log_->open_count, 2);
  EXPECT_EQ(bus_->InterfaceName(), "can1");
}

TEST_F(CanBusTest, CloseIsIdempotent) {
  OpenBus();
  bus_->Close();
  bus_->Close();

  EXPECT_FALSE(bus_->IsOpen());
  EXPECT_EQ(log_->close_count, 1);
}

TEST_F(CanBusTest, DestructorClosesOpenBus) {
  OpenBus();
  bus_.reset();
  EXPECT_EQ(log_->close_count, 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Send
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CanBusTest, SendBytesUsesControlIdentifier) {
  OpenBus();
  ASSERT_TRUE(IsOk(bus_->Send(Bytes({0x55, 0x0d, 0x04}))));

  ASSERT_EQ(log_->written.size(), 1u);
  EXPECT_EQ(log_->written[0], MakeFrame({0x55, 0x0d, 0x04}));
}

TEST_F(CanBusTest, SendRejectsMoreThanEightBytes) {
  OpenBus();
  ExpectErrorCode(bus_->Send(Bytes({1, 2, 3, 4, 5, 6, 7, 8, 9})),
                  ErrorCode::InvalidDataLength);
  EXPECT_TRUE(log_->written.empty()) << "Nothing should reach the device";
}

TEST_F(CanBusTest, SendRejectsOversizedFrame) {
  OpenBus();
  CanFrame frame;
  frame.len = 9;
  ExpectErrorCode(bus_->Send(frame), ErrorCode::InvalidDataLength);
}

TEST_F(CanBusTest, SendOnClosedBusFails) {
  auto result = bus_->Send(Bytes({0x55}));
  ExpectErrorCode(result, ErrorCode::SendFailed);
  EXPECT_EQ(GetError(result).os_error, EBADF);
}

TEST_F(CanBusTest, SendPropagatesDeviceErrno) {
  OpenBus();
  log_->write_error = ENOBUFS;

  auto result = bus_->Send(Bytes({0x55}));
  ExpectErrorCode(result, ErrorCode::SendFailed);
  EXPECT_EQ(GetError(result).os_error, ENOBUFS);
  EXPECT_TRUE(IsRecoverable(GetError(result)));
}

TEST_F(CanBusTest, BurstStopsAtFirstFailure) {
  OpenBus();
  log_->write_error = ENOBUFS;
  log_->writes_before_error = 2;

  const auto frames = SplitIntoFrames(std::vector<uint8_t>(40, 0xAB));
  ASSERT_EQ(frames.size(), 5u);

  ExpectErrorCode(bus_->SendBurst(frames), ErrorCode::SendFailed);
  EXPECT_EQ(log_->written.size(), 2u) << "Frames after the failure are dropped";
}

TEST_F(CanBusTest, BurstSendsAllFramesInOrder) {
  OpenBus();
  const auto frames = SplitIntoFrames(std::vector<uint8_t>(20, 0x11));
  ASSERT_TRUE(IsOk(bus_->SendBurst(frames)));
  EXPECT_EQ(log_->written, frames);
}

// ═══════════════════════════════════════════════════════════════════════════
// Receive
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CanBusTest, ReceiveTimeoutIsNotAnError) {
  OpenBus();
  auto result = bus_->Receive(200);

  ASSERT_TRUE(IsOk(result));
  EXPECT_FALSE(GetValue(result).has_value());
  EXPECT_EQ(log_->last_timeout_ms, 200u);
}

TEST_F(CanBusTest, ReceiveReturnsQueuedFrame) {
  OpenBus();
  log_->incoming.push_back(MakeFrame({1, 2, 3}, 0x123));

  auto result = bus_->Receive(10);
  ASSERT_TRUE(IsOk(result));
  ExpectOptionalEq(GetValue(result), MakeFrame({1, 2, 3}, 0x123));
}

TEST_F(CanBusTest, ReceiveOnClosedBusFails) {
  ExpectErrorCode(bus_->Receive(10), ErrorCode::ReceiveFailed);
}

TEST_F(CanBusTest, ReceivePropagatesDeviceErrno) {
  OpenBus();
  log_->read_error = ENETDOWN;

  auto result = bus_->Receive(10);
  ExpectErrorCode(result, ErrorCode::ReceiveFailed);
  EXPECT_EQ(GetError(result).os_error, ENETDOWN);
}

// ═══════════════════════════════════════════════════════════════════════════
// Counter Resynchronization
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CanBusTest, TwistEchoSetsJoyToDevicePlusOne) {
  OpenBus();
  log_->incoming.push_back(MakeTwistEcho(0x0041));
  SequenceCounters counters{.joy = 3, .led = 9, .gimbal = 11};

  auto result = bus_->ReceiveAndProcess(counters, 200);
  ASSERT_TRUE(IsOk(result));
  EXPECT_TRUE(GetValue(result));
  EXPECT_EQ(counters, (SequenceCounters{.joy = 0x0042, .led = 9, .gimbal = 11}));
}

TEST_F(CanBusTest, TwistEchoAtMaxCounterWrapsToZero) {
  OpenBus();
  log_->incoming.push_back(MakeTwistEcho(0xFFFF));
  SequenceCounters counters{.joy = 3};

  auto result = bus_->ReceiveAndProcess(counters, 200);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(counters.joy, 0);
}

TEST_F(CanBusTest, UnrelatedFramesLeaveCountersUntouched) {
  OpenBus();
  auto extended = MakeTwistEcho(0x10);
  extended.extended = true;
  log_->incoming.push_back(extended);
  log_->incoming.push_back(MakeTwistEcho(0x10));
  log_->incoming.back().id = 0x300;
  log_->incoming.push_back(MakeFrame({0x55, 0x1b, 0x04}));

  SequenceCounters counters{.joy = 3};
  for (int i = 0; i < 3; ++i) {
    auto result = bus_->ReceiveAndProcess(counters, 200);
    ASSERT_TRUE(IsOk(result));
    EXPECT_FALSE(GetValue(result));
  }
  EXPECT_EQ(counters.joy, 3);
}

TEST_F(CanBusTest, TimeoutLeavesCountersUntouched) {
  OpenBus();
  SequenceCounters counters{.joy = 3};

  auto result = bus_->ReceiveAndProcess(counters, 200);
  ASSERT_TRUE(IsOk(result));
  EXPECT_FALSE(GetValue(result));
  EXPECT_EQ(counters.joy, 3);
}

// ═══════════════════════════════════════════════════════════════════════════
// Hook Contract (mock)
// ═══════════════════════════════════════════════════════════════════════════

TEST(CanBusHookTest, OpenForwardsInterfaceName) {
  NiceMock<MockCanBus> bus;
  EXPECT_CALL(bus, OpenDevice(std::string_view("vcan0"))).WillOnce(Return(0));

  EXPECT_TRUE(IsOk(bus.Open("vcan0")));
}

TEST(CanBusHookTest, ReadFrameReceivesTimeout) {
  NiceMock<MockCanBus> bus;
  ON_CALL(bus, OpenDevice(_)).WillByDefault(Return(0));
  ASSERT_TRUE(IsOk(bus.Open("can0")));

  const CanFrame echo = MakeTwistEcho(0x0100);
  EXPECT_CALL(bus, ReadFrame(_, 50u))
      .WillOnce(DoAll(SetArgReferee<0>(echo), Return(1)));

  SequenceCounters counters;
  auto result = bus.ReceiveAndProcess(counters, 50);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(counters.joy, 0x0101);
}

TEST(CanBusHookTest, CloseDeviceCalledOnceAcrossCloseAndDestructor) {
  auto bus = std::make_unique<NiceMock<MockCanBus>>();
  ON_CALL(*bus, OpenDevice(_)).WillByDefault(Return(0));
  ASSERT_TRUE(IsOk(bus->Open("can0")));

  EXPECT_CALL(*bus, CloseDevice()).Times(1);
  bus->Close();
  bus.reset();
}

TEST(CanBusHookTest, WriteFrameNotCalledWhenClosed) {
  NiceMock<MockCanBus> bus;
  EXPECT_CALL(bus, WriteFrame(_)).Times(0);

  ExpectErrorCode(bus.Send(Bytes({0x55})), ErrorCode::SendFailed);
}
