// Pixel buffer and PNG file I/O for icongen
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace icongen
{
  struct PixelBuffer
  {
    uint32_t width = 0;
    uint32_t height = 0;
    // always 4 (RGBA) for buffers produced by the rasterizer
    uint32_t channels = 0;
    std::vector<uint8_t> data; // row-major, tightly packed

    size_t row_bytes() const
    {
      return static_cast<size_t>(width) * channels;
    }

    bool is_rgba() const
    {
      return channels == 4 && width != 0 && height != 0 &&
             data.size() == static_cast<size_t>(width) * height * 4;
    }
  };

  // Decode a PNG byte stream into RGBA using system libpng.
  bool decode_png(const std::vector<uint8_t> &bytes, PixelBuffer &out, std::string &err);
  bool load_png(const std::string &path, PixelBuffer &out, std::string &err);

  // Encode with the built-in encoder and write to path (parent directories are created).
  bool save_png(const std::string &path, const PixelBuffer &src, std::string &err);

  bool read_file(const std::string &path, std::vector<uint8_t> &out, std::string &err);
  bool write_file(const std::string &path, const std::vector<uint8_t> &bytes, std::string &err);
} // namespace icongen
