#pragma once

#include <cstdint>
#include <string_view>

#include "can_bus_base.hpp"

namespace robomaster {

/**
 * @brief Реализация CanBusBase для Linux SocketCAN
 *
 * Сырой сокет PF_CAN/CAN_RAW, привязанный к интерфейсу по имени. Приём
 * через poll() с таймаутом. Кадры ошибок шины (CAN_ERR_FLAG) пропускаются.
 */
class SocketCanBus : public CanBusBase {
 public:
  SocketCanBus() = default;
  ~SocketCanBus() override;

 protected:
  int OpenDevice(std::string_view interface_name) override;
  int WriteFrame(const CanFrame& frame) override;
  int ReadFrame(CanFrame& frame, uint32_t timeout_ms) override;
  void CloseDevice() noexcept override;

 private:
  int fd_{-1};
};

}  // namespace robomaster
