#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace robomaster {

// ═══════════════════════════════════════════════════════════════════════════
// Константы шины
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr uint32_t kControlArbitrationId = 0x201;  // 11 бит
inline constexpr size_t kMaxFrameData = 8;

// ═══════════════════════════════════════════════════════════════════════════
// Кадр CAN
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Кадр CAN: до 8 байт данных
 */
struct CanFrame {
  uint32_t id{kControlArbitrationId};
  bool extended{false};  ///< 29-битный идентификатор
  uint8_t len{0};
  std::array<uint8_t, kMaxFrameData> data{};

  [[nodiscard]] std::span<const uint8_t> Payload() const noexcept {
    return std::span(data.data(), len);
  }

  [[nodiscard]] bool operator==(const CanFrame& other) const noexcept {
    return id == other.id && extended == other.extended && len == other.len &&
           std::equal(data.begin(), data.begin() + len, other.data.begin());
  }
};

/**
 * @brief Собрать кадр для канала управления
 * @param bytes Данные (обрезаются до 8 байт)
 */
[[nodiscard]] CanFrame MakeControlFrame(std::span<const uint8_t> bytes) noexcept;

/**
 * @brief Разбить буфер на кадры по 8 байт
 *
 * ceil(N / 8) кадров в исходном порядке, последний может быть короче.
 * Пустой буфер даёт ноль кадров.
 * @param bytes Готовая команда (или склейка команд)
 * @return Кадры с идентификатором 0x201
 */
[[nodiscard]] std::vector<CanFrame> SplitIntoFrames(
    std::span<const uint8_t> bytes);

}  // namespace robomaster
