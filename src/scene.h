#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "image_io.h"
#include "raster.h"

namespace icongen
{
  enum class PaletteSlot
  {
    Background,
    Accent,
    Highlight,
    Shadow,
  };

  struct Palette
  {
    Color background{30, 41, 59}; // slate-800
    Color accent{56, 189, 248};   // sky-400
    Color highlight{255, 255, 255};
    Color shadow{15, 23, 42}; // slate-900

    const Color &get(PaletteSlot slot) const noexcept;
    Color &get(PaletteSlot slot) noexcept;
  };

  enum class DrawKind
  {
    Pixel,     // x, y, alpha
    Rect,      // x, y, w, h
    Circle,    // x, y (中心), r
    RoundRect, // x, y, w, h, r
    Wave,      // x, y (基線), w (幅), h (太さ), amplitude
  };

  struct DrawOp
  {
    DrawKind kind = DrawKind::Rect;
    PaletteSlot color = PaletteSlot::Accent;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    int r = 0;
    int amplitude = 0;
    int alpha = 255;
  };

  inline DrawOp make_pixel(int x, int y, PaletteSlot color, int alpha = 255)
  {
    DrawOp op;
    op.kind = DrawKind::Pixel;
    op.color = color;
    op.x = x;
    op.y = y;
    op.alpha = alpha;
    return op;
  }

  inline DrawOp make_rect(int x, int y, int w, int h, PaletteSlot color)
  {
    DrawOp op;
    op.kind = DrawKind::Rect;
    op.color = color;
    op.x = x;
    op.y = y;
    op.w = w;
    op.h = h;
    return op;
  }

  inline DrawOp make_circle(int cx, int cy, int r, PaletteSlot color)
  {
    DrawOp op;
    op.kind = DrawKind::Circle;
    op.color = color;
    op.x = cx;
    op.y = cy;
    op.r = r;
    return op;
  }

  inline DrawOp make_round_rect(int x, int y, int w, int h, int r, PaletteSlot color)
  {
    DrawOp op = make_rect(x, y, w, h, color);
    op.kind = DrawKind::RoundRect;
    op.r = r;
    return op;
  }

  inline DrawOp make_wave(int x, int y, int span, int thickness, int amplitude, PaletteSlot color)
  {
    DrawOp op = make_rect(x, y, span, thickness, color);
    op.kind = DrawKind::Wave;
    op.amplitude = amplitude;
    return op;
  }

  // キャンバスサイズ・パレット・描画命令列。命令は並び順どおりに適用される。
  struct SceneConfig
  {
    int width = 128;
    int height = 128;
    Palette palette;
    std::vector<DrawOp> scene;
  };

  // 上限はメモリ確保が現実的な範囲に抑える
  constexpr int kMaxCanvasDimension = 16384;
  // 描画命令の座標・寸法・半径・振幅の絶対値の上限
  constexpr int kMaxGeometry = 4 * kMaxCanvasDimension;

  const char *slot_name(PaletteSlot slot) noexcept;
  bool parse_slot(const std::string &name, PaletteSlot &slot) noexcept;
  const char *kind_name(DrawKind kind) noexcept;
  bool parse_kind(const std::string &name, DrawKind &kind) noexcept;

  // 128x128 のロボットアイコン。
  SceneConfig default_icon_scene();

  // 描画前に設定の妥当性を検査する。
  bool validate_scene(const SceneConfig &config, std::string &err);

  // 1 命令をキャンバスへ適用する。
  void apply_op(Canvas &canvas, const Palette &palette, const DrawOp &op);

  // 検査のうえ新しいキャンバスへシーンを描画する。
  bool render_scene(const SceneConfig &config, PixelBuffer &out, std::string &err);

  // 設定から PNG のバイト列を生成する。
  bool generate_png(const SceneConfig &config, std::vector<uint8_t> &out, std::string &err);

  // scene_json.cpp
  bool parse_scene_json(const std::string &text, SceneConfig &out, std::string &err);
  bool load_scene_json(const std::string &path, SceneConfig &out, std::string &err);
  std::string dump_scene_json(const SceneConfig &config, int indent = 2);
} // namespace icongen
