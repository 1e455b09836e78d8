#include "socketcan_bus.hpp"

#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace robomaster {

SocketCanBus::~SocketCanBus() { Close(); }

int SocketCanBus::OpenDevice(std::string_view interface_name) {
  if (interface_name.empty() || interface_name.size() >= IFNAMSIZ) {
    return ENODEV;
  }

  const int fd = socket(PF_CAN, SOCK_RAW, CAN_RAW);
  if (fd < 0) return errno;

  struct ifreq ifr {};
  std::memcpy(ifr.ifr_name, interface_name.data(), interface_name.size());
  if (ioctl(fd, SIOCGIFINDEX, &ifr) < 0) {
    const int err = errno;
    close(fd);
    return err;
  }

  struct sockaddr_can addr {};
  addr.can_family = AF_CAN;
  addr.can_ifindex = ifr.ifr_ifindex;
  if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    const int err = errno;
    close(fd);
    return err;
  }

  fd_ = fd;
  return 0;
}

int SocketCanBus::WriteFrame(const CanFrame& frame) {
  struct can_frame cf {};
  cf.can_id = frame.extended ? ((frame.id & CAN_EFF_MASK) | CAN_EFF_FLAG)
                             : (frame.id & CAN_SFF_MASK);
  cf.can_dlc = frame.len;
  std::memcpy(cf.data, frame.data.data(), frame.len);

  ssize_t n;
  do {
    n = write(fd_, &cf, sizeof(cf));
  } while (n < 0 && errno == EINTR);

  if (n < 0) return errno;
  if (static_cast<size_t>(n) != sizeof(cf)) return EIO;
  return 0;
}

int SocketCanBus::ReadFrame(CanFrame& frame, uint32_t timeout_ms) {
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;

  const int ready = poll(&pfd, 1, static_cast<int>(timeout_ms));
  if (ready < 0) {
    return errno == EINTR ? 0 : -errno;
  }
  if (ready == 0) return 0;

  struct can_frame cf {};
  const ssize_t n = read(fd_, &cf, sizeof(cf));
  if (n < 0) {
    return (errno == EINTR || errno == EAGAIN) ? 0 : -errno;
  }
  if (static_cast<size_t>(n) != sizeof(cf)) return -EIO;

  // Кадры ошибок шины не являются данными
  if (cf.can_id & CAN_ERR_FLAG) return 0;

  frame.extended = (cf.can_id & CAN_EFF_FLAG) != 0;
  frame.id = frame.extended ? (cf.can_id & CAN_EFF_MASK)
                            : (cf.can_id & CAN_SFF_MASK);
  frame.len = std::min<uint8_t>(cf.can_dlc, CAN_MAX_DLEN);
  std::memcpy(frame.data.data(), cf.data, frame.len);
  return 1;
}

void SocketCanBus::CloseDevice() noexcept {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

}  // namespace robomaster
