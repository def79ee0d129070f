#include "crc32.h"

namespace
{
  constexpr uint32_t kPolynomial = 0xEDB88320u;

  constexpr std::array<uint32_t, 256> make_table()
  {
    std::array<uint32_t, 256> table{};
    for (uint32_t n = 0; n < 256; ++n)
    {
      uint32_t c = n;
      for (int k = 0; k < 8; ++k)
        c = (c & 1u) ? (kPolynomial ^ (c >> 1)) : (c >> 1);
      table[n] = c;
    }
    return table;
  }

  constexpr std::array<uint32_t, 256> kTable = make_table();

  static_assert(kTable[0] == 0x00000000u, "CRC テーブルの先頭が不正です");
  static_assert(kTable[1] == 0x77073096u, "CRC テーブルの構築結果が想定と異なります");
  static_assert(kTable[255] == 0x2D02EF8Du, "CRC テーブルの構築結果が想定と異なります");
} // namespace

namespace icongen
{
  const std::array<uint32_t, 256> &crc32_table() noexcept
  {
    return kTable;
  }

  uint32_t crc32_update(uint32_t crc, const void *data, std::size_t length) noexcept
  {
    const uint8_t *p = static_cast<const uint8_t *>(data);
    uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < length; ++i)
      c = kTable[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    return c ^ 0xFFFFFFFFu;
  }
} // namespace icongen
