#include "scene.h"

#include "png_encoder.h"

#include <string>

namespace
{
  using icongen::DrawKind;
  using icongen::PaletteSlot;

  struct SlotName
  {
    PaletteSlot slot;
    const char *name;
  };

  constexpr SlotName kSlotNames[] = {
      {PaletteSlot::Background, "background"},
      {PaletteSlot::Accent, "accent"},
      {PaletteSlot::Highlight, "highlight"},
      {PaletteSlot::Shadow, "shadow"},
  };

  struct KindName
  {
    DrawKind kind;
    const char *name;
  };

  constexpr KindName kKindNames[] = {
      {DrawKind::Pixel, "pixel"},
      {DrawKind::Rect, "rect"},
      {DrawKind::Circle, "circle"},
      {DrawKind::RoundRect, "round_rect"},
      {DrawKind::Wave, "wave"},
  };

  std::string op_prefix(size_t index)
  {
    return "scene[" + std::to_string(index) + "]: ";
  }
} // namespace

namespace icongen
{
  const Color &Palette::get(PaletteSlot slot) const noexcept
  {
    switch (slot)
    {
    case PaletteSlot::Background:
      return background;
    case PaletteSlot::Accent:
      return accent;
    case PaletteSlot::Highlight:
      return highlight;
    case PaletteSlot::Shadow:
      break;
    }
    return shadow;
  }

  Color &Palette::get(PaletteSlot slot) noexcept
  {
    return const_cast<Color &>(static_cast<const Palette &>(*this).get(slot));
  }

  const char *slot_name(PaletteSlot slot) noexcept
  {
    for (const auto &entry : kSlotNames)
    {
      if (entry.slot == slot)
        return entry.name;
    }
    return "unknown";
  }

  bool parse_slot(const std::string &name, PaletteSlot &slot) noexcept
  {
    for (const auto &entry : kSlotNames)
    {
      if (name == entry.name)
      {
        slot = entry.slot;
        return true;
      }
    }
    return false;
  }

  const char *kind_name(DrawKind kind) noexcept
  {
    for (const auto &entry : kKindNames)
    {
      if (entry.kind == kind)
        return entry.name;
    }
    return "unknown";
  }

  bool parse_kind(const std::string &name, DrawKind &kind) noexcept
  {
    for (const auto &entry : kKindNames)
    {
      if (name == entry.name)
      {
        kind = entry.kind;
        return true;
      }
    }
    return false;
  }

  SceneConfig default_icon_scene()
  {
    SceneConfig cfg;
    cfg.width = 128;
    cfg.height = 128;

    auto &s = cfg.scene;
    // 角丸の背景
    s.push_back(make_round_rect(0, 0, 128, 128, 16, PaletteSlot::Background));
    // 頭部と顔
    s.push_back(make_round_rect(30, 22, 68, 56, 10, PaletteSlot::Accent));
    s.push_back(make_round_rect(36, 28, 56, 44, 6, PaletteSlot::Shadow));
    // 目とハイライト
    s.push_back(make_circle(52, 46, 7, PaletteSlot::Accent));
    s.push_back(make_circle(76, 46, 7, PaletteSlot::Accent));
    s.push_back(make_circle(50, 44, 3, PaletteSlot::Highlight));
    s.push_back(make_circle(74, 44, 3, PaletteSlot::Highlight));
    // 口
    s.push_back(make_wave(48, 58, 32, 2, 2, PaletteSlot::Accent));
    // アンテナ
    s.push_back(make_rect(62, 10, 4, 14, PaletteSlot::Accent));
    s.push_back(make_circle(64, 8, 5, PaletteSlot::Accent));
    s.push_back(make_circle(64, 8, 3, PaletteSlot::Highlight));
    // 胴体
    s.push_back(make_round_rect(38, 82, 52, 28, 6, PaletteSlot::Accent));
    s.push_back(make_round_rect(42, 86, 44, 20, 4, PaletteSlot::Shadow));
    for (int i = 0; i < 3; ++i)
      s.push_back(make_rect(50, 90 + i * 5, 28, 2, PaletteSlot::Accent));
    return cfg;
  }

  bool validate_scene(const SceneConfig &config, std::string &err)
  {
    err.clear();
    if (config.width <= 0 || config.height <= 0)
    {
      err = "canvas size must be positive: " + std::to_string(config.width) + "x" + std::to_string(config.height);
      return false;
    }
    if (config.width > kMaxCanvasDimension || config.height > kMaxCanvasDimension)
    {
      err = "canvas size exceeds " + std::to_string(kMaxCanvasDimension) + ": " +
            std::to_string(config.width) + "x" + std::to_string(config.height);
      return false;
    }

    for (size_t i = 0; i < config.scene.size(); ++i)
    {
      const DrawOp &op = config.scene[i];
      const struct
      {
        const char *name;
        int value;
      } geometry[] = {{"x", op.x}, {"y", op.y}, {"w", op.w}, {"h", op.h}, {"r", op.r}, {"amplitude", op.amplitude}};
      for (const auto &g : geometry)
      {
        if (g.value < -kMaxGeometry || g.value > kMaxGeometry)
        {
          err = op_prefix(i) + "\"" + g.name + "\" exceeds " + std::to_string(kMaxGeometry) + ": " + std::to_string(g.value);
          return false;
        }
      }
      switch (op.kind)
      {
      case DrawKind::Pixel:
        if (op.alpha < 0 || op.alpha > 255)
        {
          err = op_prefix(i) + "alpha out of range: " + std::to_string(op.alpha);
          return false;
        }
        break;
      case DrawKind::Rect:
      case DrawKind::RoundRect:
      case DrawKind::Wave:
        if (op.w < 0 || op.h < 0)
        {
          err = op_prefix(i) + "negative size for " + kind_name(op.kind);
          return false;
        }
        if (op.kind == DrawKind::RoundRect && op.r < 0)
        {
          err = op_prefix(i) + "negative radius";
          return false;
        }
        break;
      case DrawKind::Circle:
        if (op.r < 0)
        {
          err = op_prefix(i) + "negative radius";
          return false;
        }
        break;
      default:
        err = op_prefix(i) + "unknown draw operation";
        return false;
      }
    }
    return true;
  }

  void apply_op(Canvas &canvas, const Palette &palette, const DrawOp &op)
  {
    const Color &c = palette.get(op.color);
    switch (op.kind)
    {
    case DrawKind::Pixel:
      canvas.set_pixel(op.x, op.y, c.r, c.g, c.b, static_cast<uint8_t>(op.alpha));
      break;
    case DrawKind::Rect:
      canvas.fill_rect(op.x, op.y, op.w, op.h, c);
      break;
    case DrawKind::Circle:
      canvas.fill_circle(op.x, op.y, op.r, c);
      break;
    case DrawKind::RoundRect:
      canvas.fill_round_rect(op.x, op.y, op.w, op.h, op.r, c);
      break;
    case DrawKind::Wave:
      canvas.draw_wave(op.x, op.y, op.w, op.amplitude, op.h, c);
      break;
    }
  }

  bool render_scene(const SceneConfig &config, PixelBuffer &out, std::string &err)
  {
    if (!validate_scene(config, err))
      return false;

    Canvas canvas(config.width, config.height);
    for (const DrawOp &op : config.scene)
      apply_op(canvas, config.palette, op);
    out = canvas.release();
    return true;
  }

  bool generate_png(const SceneConfig &config, std::vector<uint8_t> &out, std::string &err)
  {
    out.clear();
    PixelBuffer pixels;
    if (!render_scene(config, pixels, err))
      return false;
    return encode_png(pixels, out, err);
  }
} // namespace icongen
