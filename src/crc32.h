#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace icongen
{
  // CRC-32 (反転多項式 0xEDB88320) のテーブル。コンパイル時に一度だけ構築される。
  const std::array<uint32_t, 256> &crc32_table() noexcept;

  // 事前・事後に 0xFFFFFFFF を XOR した状態の CRC に data を追加する。
  // crc32_update(crc32(a), b) は crc32(a と b の連結) と等しい。
  uint32_t crc32_update(uint32_t crc, const void *data, std::size_t length) noexcept;

  // data 全体の CRC-32。空入力では 0 を返す。
  inline uint32_t crc32(const void *data, std::size_t length) noexcept
  {
    return crc32_update(0u, data, length);
  }

  inline uint32_t crc32(const std::vector<uint8_t> &bytes) noexcept
  {
    return crc32_update(0u, bytes.data(), bytes.size());
  }

  // 分割して与えられるデータ用の簡易クラス。
  class Crc32
  {
  public:
    void update(const void *data, std::size_t length) noexcept
    {
      value_ = crc32_update(value_, data, length);
    }

    uint32_t value() const noexcept { return value_; }

    void reset() noexcept { value_ = 0; }

  private:
    uint32_t value_ = 0;
  };
} // namespace icongen
