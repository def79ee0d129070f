#include "png_encoder.h"

#include "crc32.h"
#include "raster.h"

#include <zlib.h>

#include <cstring>
#include <limits>

namespace
{
  inline void append_u32be(std::vector<uint8_t> &out, uint32_t v)
  {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>(v & 0xff));
  }

  inline void store_u32be(uint8_t *p, uint32_t v)
  {
    p[0] = static_cast<uint8_t>((v >> 24) & 0xff);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xff);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xff);
    p[3] = static_cast<uint8_t>(v & 0xff);
  }

  constexpr char kIHDR[4] = {'I', 'H', 'D', 'R'};
  constexpr char kIDAT[4] = {'I', 'D', 'A', 'T'};
  constexpr char kIEND[4] = {'I', 'E', 'N', 'D'};
} // namespace

namespace icongen::png
{
  uint32_t chunk_crc(const char type[4], const uint8_t *data, size_t size)
  {
    Crc32 crc;
    crc.update(type, 4);
    if (size != 0)
      crc.update(data, size);
    return crc.value();
  }

  void append_chunk(std::vector<uint8_t> &out, const char type[4], const uint8_t *data, size_t size)
  {
    out.reserve(out.size() + size + 12);
    append_u32be(out, static_cast<uint32_t>(size));
    out.insert(out.end(), type, type + 4);
    if (size != 0)
      out.insert(out.end(), data, data + size);
    append_u32be(out, chunk_crc(type, data, size));
  }

  std::array<uint8_t, kIhdrSize> make_ihdr(uint32_t width, uint32_t height)
  {
    std::array<uint8_t, kIhdrSize> ihdr{};
    store_u32be(&ihdr[0], width);
    store_u32be(&ihdr[4], height);
    ihdr[8] = kBitDepth;
    ihdr[9] = kColorTypeRgba;
    ihdr[10] = 0; // compression: deflate
    ihdr[11] = 0; // filter method
    ihdr[12] = 0; // interlace: none
    return ihdr;
  }

  std::vector<uint8_t> build_scanlines(const PixelBuffer &src)
  {
    const size_t row = src.row_bytes();
    std::vector<uint8_t> raw((row + 1) * src.height);
    uint8_t *d = raw.data();
    for (uint32_t y = 0; y < src.height; ++y)
    {
      *d++ = kFilterNone;
      std::memcpy(d, src.data.data() + static_cast<size_t>(y) * row, row);
      d += row;
    }
    return raw;
  }

  bool deflate_max(const std::vector<uint8_t> &raw, std::vector<uint8_t> &out, std::string &err)
  {
    out.clear();
    if (raw.size() > std::numeric_limits<uLong>::max())
    {
      err = "scanline data too large for zlib";
      return false;
    }
    uLongf out_len = compressBound(static_cast<uLong>(raw.size()));
    out.resize(out_len);
    const int ret = compress2(out.data(), &out_len, raw.data(), static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION);
    if (ret != Z_OK)
    {
      out.clear();
      err = "zlib compress2 failed: " + std::to_string(ret);
      return false;
    }
    out.resize(out_len);
    return true;
  }
} // namespace icongen::png

namespace icongen
{
  bool encode_png(const PixelBuffer &src, std::vector<uint8_t> &out, std::string &err)
  {
    err.clear();
    out.clear();
    if (src.channels != 4)
    {
      err = "unsupported pixel channels";
      return false;
    }
    if (src.width == 0 || src.height == 0 || src.width > png::kMaxDimension || src.height > png::kMaxDimension)
    {
      err = "invalid image dimensions";
      return false;
    }
    if (!src.is_rgba())
    {
      err = "pixel buffer size mismatch";
      return false;
    }

    std::vector<uint8_t> idat;
    if (!png::deflate_max(png::build_scanlines(src), idat, err))
      return false;
    if (idat.size() > png::kMaxDimension)
    {
      err = "compressed image data exceeds chunk size limit";
      return false;
    }

    const auto ihdr = png::make_ihdr(src.width, src.height);

    std::vector<uint8_t> result;
    result.reserve(png::kSignature.size() + (12 + ihdr.size()) + (12 + idat.size()) + 12);
    result.insert(result.end(), png::kSignature.begin(), png::kSignature.end());
    png::append_chunk(result, kIHDR, ihdr.data(), ihdr.size());
    png::append_chunk(result, kIDAT, idat);
    png::append_chunk(result, kIEND, nullptr, 0);

    out.swap(result);
    return true;
  }

  bool encode_png(const Canvas &canvas, std::vector<uint8_t> &out, std::string &err)
  {
    return encode_png(canvas.pixels(), out, err);
  }
} // namespace icongen
