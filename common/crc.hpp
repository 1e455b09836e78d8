#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace robomaster::protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Константы контрольных сумм
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr uint8_t kCrc8Init = 0x77;
inline constexpr uint16_t kCrc16Init = 13970;  // 0x3692
inline constexpr size_t kCrc16Size = 2;

// ═══════════════════════════════════════════════════════════════════════════
// CRC8
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Вычислить CRC8 (табличный, отражённый полином 0x31)
 * @param data Данные
 * @param seed Начальное значение (по умолчанию 0x77)
 * @return CRC8
 */
[[nodiscard]] uint8_t CalculateCrc8(std::span<const uint8_t> data,
                                    uint8_t seed = kCrc8Init) noexcept;

/**
 * @brief Дописать CRC8 в конец буфера
 */
void AppendCrc8(std::vector<uint8_t>& buffer);

/**
 * @brief Проверить, что последний байт равен CRC8 от предыдущих
 * @return false для пустого буфера
 */
[[nodiscard]] bool VerifyCrc8(std::span<const uint8_t> data) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// CRC16
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Вычислить CRC16 (табличный, отражённый полином 0x1021)
 * @param data Данные
 * @param seed Начальное значение (по умолчанию 13970)
 * @return CRC16
 */
[[nodiscard]] uint16_t CalculateCrc16(std::span<const uint8_t> data,
                                      uint16_t seed = kCrc16Init) noexcept;

/**
 * @brief Дописать CRC16 от всего буфера в little-endian
 */
void AppendCrc16(std::vector<uint8_t>& buffer);

/**
 * @brief Проверить CRC16 в последних двух байтах
 * @return false, если буфер короче двух байт или CRC не совпала
 */
[[nodiscard]] bool VerifyCrc16(std::span<const uint8_t> data) noexcept;

}  // namespace robomaster::protocol
