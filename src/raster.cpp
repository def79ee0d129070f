#include "raster.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace
{
  constexpr double kPi = 3.14159265358979323846;

  // [lo, hi] を [0, limit) に切り詰める。空になった場合は false。
  inline bool clip_range(int64_t &lo, int64_t &hi, int limit)
  {
    lo = std::max<int64_t>(lo, 0);
    hi = std::min<int64_t>(hi, static_cast<int64_t>(limit) - 1);
    return lo <= hi;
  }
} // namespace

namespace icongen
{
  Canvas::Canvas(int width, int height)
  {
    if (width <= 0 || height <= 0)
      throw std::invalid_argument("invalid canvas size " + std::to_string(width) + "x" + std::to_string(height));
    buf_.width = static_cast<uint32_t>(width);
    buf_.height = static_cast<uint32_t>(height);
    buf_.channels = 4;
    buf_.data.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0);
  }

  void Canvas::set_pixel(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
  {
    if (!contains(x, y))
      return;
    uint8_t *p = &buf_.data[(static_cast<size_t>(y) * buf_.width + static_cast<size_t>(x)) * 4];
    p[0] = r;
    p[1] = g;
    p[2] = b;
    p[3] = a;
  }

  void Canvas::fill_rect(int x0, int y0, int w, int h, const Color &color)
  {
    fill_box(x0, y0, w, h, color);
  }

  void Canvas::fill_circle(int cx, int cy, int r, const Color &color)
  {
    fill_disc(cx, cy, r, color);
  }

  void Canvas::fill_round_rect(int x0, int y0, int w, int h, int r, const Color &color)
  {
    const int64_t x = x0, y = y0, rr = r;
    const int64_t inner_w = static_cast<int64_t>(w) - 2 * rr;
    const int64_t inner_h = static_cast<int64_t>(h) - 2 * rr;

    fill_box(x + rr, y + rr, inner_w, inner_h, color); // center
    fill_box(x + rr, y, inner_w, rr, color);           // top
    fill_box(x + rr, y + h - rr, inner_w, rr, color);  // bottom
    fill_box(x, y + rr, rr, inner_h, color);           // left
    fill_box(x + w - rr, y + rr, rr, inner_h, color);  // right

    fill_disc(x + rr, y + rr, rr, color);
    fill_disc(x + w - rr - 1, y + rr, rr, color);
    fill_disc(x + rr, y + h - rr - 1, rr, color);
    fill_disc(x + w - rr - 1, y + h - rr - 1, rr, color);
  }

  void Canvas::draw_wave(int x0, int y0, int span, int amplitude, int thickness, const Color &color)
  {
    if (span <= 0 || thickness <= 0)
      return;
    // y は i と span だけで決まるので、見える列だけを走査する
    int64_t ia = -static_cast<int64_t>(x0);
    int64_t ib = static_cast<int64_t>(width()) - 1 - x0;
    ia = std::max<int64_t>(ia, 0);
    ib = std::min<int64_t>(ib, span);
    for (int64_t i = ia; i <= ib; ++i)
    {
      const double t = static_cast<double>(i) / span * kPi;
      // 0.5 は常に切り上げる
      const int64_t y = static_cast<int64_t>(y0) + static_cast<int64_t>(std::floor(amplitude * std::sin(t) + 0.5));
      int64_t ya = y, yb = y + thickness - 1;
      if (!clip_range(ya, yb, height()))
        continue;
      for (int64_t row = ya; row <= yb; ++row)
        set_pixel(static_cast<int>(x0 + i), static_cast<int>(row), color.r, color.g, color.b);
    }
  }

  // 画素ごとのクリップと同じ結果になるよう、先に走査範囲を絞る
  void Canvas::fill_box(int64_t x0, int64_t y0, int64_t w, int64_t h, const Color &color)
  {
    if (w <= 0 || h <= 0)
      return;
    int64_t xa = x0, xb = x0 + w - 1;
    int64_t ya = y0, yb = y0 + h - 1;
    if (!clip_range(xa, xb, width()) || !clip_range(ya, yb, height()))
      return;
    for (int64_t y = ya; y <= yb; ++y)
      for (int64_t x = xa; x <= xb; ++x)
        set_pixel(static_cast<int>(x), static_cast<int>(y), color.r, color.g, color.b);
  }

  void Canvas::fill_disc(int64_t cx, int64_t cy, int64_t r, const Color &color)
  {
    if (r < 0)
      return;
    // |dx|, |dy| <= r <= INT_MAX なので dx² + dy² は int64_t に収まる
    const int64_t rr = r * r;
    int64_t xa = cx - r, xb = cx + r;
    int64_t ya = cy - r, yb = cy + r;
    if (!clip_range(xa, xb, width()) || !clip_range(ya, yb, height()))
      return;
    for (int64_t y = ya; y <= yb; ++y)
    {
      const int64_t dy = y - cy;
      for (int64_t x = xa; x <= xb; ++x)
      {
        const int64_t dx = x - cx;
        if (dx * dx + dy * dy <= rr)
          set_pixel(static_cast<int>(x), static_cast<int>(y), color.r, color.g, color.b);
      }
    }
  }

  Rgba Canvas::pixel(int x, int y) const
  {
    if (!contains(x, y))
      return {};
    const uint8_t *p = &buf_.data[(static_cast<size_t>(y) * buf_.width + static_cast<size_t>(x)) * 4];
    return {p[0], p[1], p[2], p[3]};
  }

  PixelBuffer Canvas::release() noexcept
  {
    return std::move(buf_);
  }
} // namespace icongen
