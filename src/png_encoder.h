// Byte-level PNG container encoder (no libpng on the write path)
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "image_io.h"

namespace icongen
{
  class Canvas;

  namespace png
  {
    constexpr std::array<uint8_t, 8> kSignature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    constexpr uint8_t kBitDepth = 8;
    constexpr uint8_t kColorTypeRgba = 6;
    constexpr uint8_t kFilterNone = 0;
    constexpr size_t kIhdrSize = 13;
    // PNG limits width/height to 2^31-1
    constexpr uint32_t kMaxDimension = 0x7FFFFFFFu;

    // CRC over the 4-byte type followed by the payload (the length field is not covered).
    uint32_t chunk_crc(const char type[4], const uint8_t *data, size_t size);

    // length(BE) | type | payload | crc(BE)
    void append_chunk(std::vector<uint8_t> &out, const char type[4], const uint8_t *data, size_t size);

    inline void append_chunk(std::vector<uint8_t> &out, const char type[4], const std::vector<uint8_t> &payload)
    {
      append_chunk(out, type, payload.data(), payload.size());
    }

    std::array<uint8_t, kIhdrSize> make_ihdr(uint32_t width, uint32_t height);

    // Every row is prefixed with filter type 0 followed by width*4 RGBA bytes.
    std::vector<uint8_t> build_scanlines(const PixelBuffer &src);

    // zlib stream at maximum compression level.
    bool deflate_max(const std::vector<uint8_t> &raw, std::vector<uint8_t> &out, std::string &err);
  } // namespace png

  // signature + IHDR + IDAT + IEND. On failure out is left empty.
  bool encode_png(const PixelBuffer &src, std::vector<uint8_t> &out, std::string &err);
  bool encode_png(const Canvas &canvas, std::vector<uint8_t> &out, std::string &err);
} // namespace icongen
