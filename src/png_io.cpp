// PNG decoding using system libpng; writing goes through the built-in encoder
#include "image_io.h"
#include "png_encoder.h"

#include <png.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <vector>

namespace
{
  struct MemoryReader
  {
    const uint8_t *data = nullptr;
    size_t size = 0;
    size_t pos = 0;
  };

  void png_read_fn(png_structp png_ptr, png_bytep data, png_size_t length)
  {
    MemoryReader *src = static_cast<MemoryReader *>(png_get_io_ptr(png_ptr));
    if (length > src->size - src->pos)
      png_error(png_ptr, "read past end of data");
    std::memcpy(data, src->data + src->pos, length);
    src->pos += length;
  }

  void png_error_fn(png_structp png_ptr, png_const_charp msg)
  {
    std::string *err = static_cast<std::string *>(png_get_error_ptr(png_ptr));
    if (err && err->empty())
      *err = msg;
    png_longjmp(png_ptr, 1);
  }

  void png_warning_fn(png_structp, png_const_charp)
  {
  }
} // namespace

namespace icongen
{
  bool decode_png(const std::vector<uint8_t> &bytes, PixelBuffer &out, std::string &err)
  {
    err.clear();
    if (bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8) != 0)
    {
      err = "not a PNG stream";
      return false;
    }

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, &err, png_error_fn, png_warning_fn);
    if (!png_ptr)
    {
      err = "png_create_read_struct failed";
      return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr)
    {
      png_destroy_read_struct(&png_ptr, nullptr, nullptr);
      err = "png_create_info_struct failed";
      return false;
    }

    MemoryReader reader{bytes.data(), bytes.size(), 0};
    std::vector<uint8_t> buffer;
    std::vector<png_bytep> rows;

    if (setjmp(png_jmpbuf(png_ptr)))
    {
      png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
      if (err.empty())
        err = "libpng error";
      return false;
    }

    png_set_read_fn(png_ptr, &reader, png_read_fn);
    png_read_info(png_ptr, info_ptr);

    png_uint_32 w, h;
    int bit_depth, color_type;
    png_get_IHDR(png_ptr, info_ptr, &w, &h, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    // Normalize everything to 8-bit RGBA
    if (bit_depth == 16)
      png_set_strip_16(png_ptr);
    if (color_type == PNG_COLOR_TYPE_PALETTE)
      png_set_palette_to_rgb(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
      png_set_expand_gray_1_2_4_to_8(png_ptr);
    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS))
      png_set_tRNS_to_alpha(png_ptr);
    if (color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_PALETTE)
      png_set_filler(png_ptr, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA)
      png_set_gray_to_rgb(png_ptr);

    png_read_update_info(png_ptr, info_ptr);

    const png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
    buffer.resize(rowbytes * h);
    rows.resize(h);
    for (png_uint_32 y = 0; y < h; ++y)
      rows[y] = buffer.data() + y * rowbytes;
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);

    out.width = w;
    out.height = h;
    out.channels = 4;
    out.data.resize(static_cast<size_t>(w) * h * 4);
    for (png_uint_32 y = 0; y < h; ++y)
      std::memcpy(out.data.data() + static_cast<size_t>(y) * w * 4, rows[y], static_cast<size_t>(w) * 4);
    return true;
  }

  bool load_png(const std::string &path, PixelBuffer &out, std::string &err)
  {
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes, err))
      return false;
    return decode_png(bytes, out, err);
  }

  bool save_png(const std::string &path, const PixelBuffer &src, std::string &err)
  {
    std::vector<uint8_t> bytes;
    if (!encode_png(src, bytes, err))
      return false;
    return write_file(path, bytes, err);
  }

  bool read_file(const std::string &path, std::vector<uint8_t> &out, std::string &err)
  {
    err.clear();
    FILE *fp = std::fopen(path.c_str(), "rb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }
    out.clear();
    uint8_t chunk[4096];
    size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0)
      out.insert(out.end(), chunk, chunk + n);
    const bool failed = std::ferror(fp) != 0;
    std::fclose(fp);
    if (failed)
    {
      err = "read error";
      return false;
    }
    return true;
  }

  bool write_file(const std::string &path, const std::vector<uint8_t> &bytes, std::string &err)
  {
    err.clear();
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
    {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec)
      {
        err = "cannot create directory " + parent.string() + ": " + ec.message();
        return false;
      }
    }

    FILE *fp = std::fopen(path.c_str(), "wb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }
    if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), fp) != bytes.size())
    {
      std::fclose(fp);
      err = "write error";
      return false;
    }
    if (std::fclose(fp) != 0)
    {
      err = "write error";
      return false;
    }
    return true;
  }
} // namespace icongen
