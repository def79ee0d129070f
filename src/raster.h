#pragma once

#include <cstdint>

#include "image_io.h"

namespace icongen
{
  // RGB の 3 要素。塗りつぶし系の描画では常にアルファ 255 で書き込む。
  struct Color
  {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
  };

  inline bool operator==(const Color &lhs, const Color &rhs)
  {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
  }

  inline bool operator!=(const Color &lhs, const Color &rhs)
  {
    return !(lhs == rhs);
  }

  struct Rgba
  {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;
  };

  inline bool operator==(const Rgba &lhs, const Rgba &rhs)
  {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
  }

  // 固定サイズの RGBA キャンバス。
  // 描画は呼び出し順に適用され、後の描画が前の画素を完全に上書きする (ブレンドなし)。
  // キャンバス外への書き込みは黙って捨てられる。
  class Canvas
  {
  public:
    // width/height が 0 以下なら std::invalid_argument を送出する。
    Canvas(int width, int height);

    int width() const noexcept { return static_cast<int>(buf_.width); }
    int height() const noexcept { return static_cast<int>(buf_.height); }

    bool contains(int x, int y) const noexcept
    {
      return x >= 0 && y >= 0 && x < width() && y < height();
    }

    void set_pixel(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

    // [x0, x0+w) × [y0, y0+h) を塗る。w/h が 0 以下なら何もしない。
    void fill_rect(int x0, int y0, int w, int h, const Color &color);

    // 中心からの距離の二乗が r² 以下の整数座標をすべて塗る (境界を含む)。
    void fill_circle(int cx, int cy, int r, const Color &color);

    // 5 つの矩形と四隅の円で角丸矩形を構成する。
    // 右・下の円は中心を 1 画素内側へずらす。r > w/2 や r > h/2 は検査しない。
    void fill_round_rect(int x0, int y0, int w, int h, int r, const Color &color);

    // x0..x0+span の各列に、y0 + round(amplitude * sin(i/span * π)) から thickness 画素の縦線を引く。
    void draw_wave(int x0, int y0, int span, int amplitude, int thickness, const Color &color);

    // キャンバス外なら透明黒を返す。
    Rgba pixel(int x, int y) const;

    const PixelBuffer &pixels() const noexcept { return buf_; }

    // 内部バッファを取り出す。以後このキャンバスは使用しないこと。
    PixelBuffer release() noexcept;

  private:
    // 座標計算は 64 ビットで行い、int の範囲を超える合成値も安全にクリップする。
    void fill_box(int64_t x0, int64_t y0, int64_t w, int64_t h, const Color &color);
    void fill_disc(int64_t cx, int64_t cy, int64_t r, const Color &color);

    PixelBuffer buf_;
  };
} // namespace icongen
