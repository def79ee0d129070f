// Scene configuration <-> JSON
#include "image_io.h"
#include "scene.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>

using nlohmann::json;

namespace
{
  using namespace icongen;

  // 整数値を [lo, hi] の範囲で取り出す。
  // 符号なしとして格納された値は int64_t へ直接変換すると折り返すため先に判定する。
  bool integer_in_range(const json &value, std::int64_t lo, std::int64_t hi, std::int64_t &out)
  {
    if (value.is_number_unsigned())
    {
      const auto u = value.get<std::uint64_t>();
      if (hi < 0 || u > static_cast<std::uint64_t>(hi))
        return false;
      out = static_cast<std::int64_t>(u);
      return lo <= out;
    }
    out = value.get<std::int64_t>();
    return lo <= out && out <= hi;
  }

  bool read_int(const json &obj, const char *key, int &value, std::string &err)
  {
    const auto it = obj.find(key);
    if (it == obj.end())
      return true;
    if (!it->is_number_integer())
    {
      err = std::string("\"") + key + "\" must be an integer";
      return false;
    }
    std::int64_t v;
    if (!integer_in_range(*it, INT32_MIN, INT32_MAX, v))
    {
      err = std::string("\"") + key + "\" out of range: " + it->dump();
      return false;
    }
    value = static_cast<int>(v);
    return true;
  }

  bool read_color(const json &value, Color &out, std::string &err)
  {
    if (!value.is_array() || value.size() != 3)
    {
      err = "color must be an array of three integers";
      return false;
    }
    uint8_t ch[3];
    for (size_t i = 0; i < 3; ++i)
    {
      if (!value[i].is_number_integer())
      {
        err = "color channel must be an integer";
        return false;
      }
      std::int64_t v;
      if (!integer_in_range(value[i], 0, 255, v))
      {
        err = "color channel out of range: " + value[i].dump();
        return false;
      }
      ch[i] = static_cast<uint8_t>(v);
    }
    out = Color{ch[0], ch[1], ch[2]};
    return true;
  }

  bool read_palette(const json &value, Palette &palette, std::string &err)
  {
    if (!value.is_object())
    {
      err = "\"palette\" must be an object";
      return false;
    }
    for (auto it = value.begin(); it != value.end(); ++it)
    {
      PaletteSlot slot;
      if (!parse_slot(it.key(), slot))
      {
        err = "unknown palette slot: " + it.key();
        return false;
      }
      if (!read_color(it.value(), palette.get(slot), err))
      {
        err = "palette." + it.key() + ": " + err;
        return false;
      }
    }
    return true;
  }

  bool read_op(const json &value, DrawOp &op, std::string &err)
  {
    if (!value.is_object())
    {
      err = "draw operation must be an object";
      return false;
    }
    const auto kind = value.find("op");
    if (kind == value.end() || !kind->is_string() || !parse_kind(kind->get<std::string>(), op.kind))
    {
      err = "missing or unknown \"op\"";
      return false;
    }
    const auto color = value.find("color");
    if (color != value.end())
    {
      if (!color->is_string() || !parse_slot(color->get<std::string>(), op.color))
      {
        err = "unknown color slot";
        return false;
      }
    }
    return read_int(value, "x", op.x, err) &&
           read_int(value, "y", op.y, err) &&
           read_int(value, "w", op.w, err) &&
           read_int(value, "h", op.h, err) &&
           read_int(value, "r", op.r, err) &&
           read_int(value, "amplitude", op.amplitude, err) &&
           read_int(value, "alpha", op.alpha, err);
  }

  json op_to_json(const DrawOp &op)
  {
    json j;
    j["op"] = kind_name(op.kind);
    j["x"] = op.x;
    j["y"] = op.y;
    switch (op.kind)
    {
    case DrawKind::Pixel:
      j["alpha"] = op.alpha;
      break;
    case DrawKind::Rect:
      j["w"] = op.w;
      j["h"] = op.h;
      break;
    case DrawKind::Circle:
      j["r"] = op.r;
      break;
    case DrawKind::RoundRect:
      j["w"] = op.w;
      j["h"] = op.h;
      j["r"] = op.r;
      break;
    case DrawKind::Wave:
      j["w"] = op.w;
      j["h"] = op.h;
      j["amplitude"] = op.amplitude;
      break;
    }
    j["color"] = slot_name(op.color);
    return j;
  }
} // namespace

namespace icongen
{
  bool parse_scene_json(const std::string &text, SceneConfig &out, std::string &err)
  {
    err.clear();
    json root;
    try
    {
      root = json::parse(text);
    }
    catch (const json::exception &exc)
    {
      err = std::string("JSON parse error: ") + exc.what();
      return false;
    }
    if (!root.is_object())
    {
      err = "scene root must be an object";
      return false;
    }

    SceneConfig cfg;
    if (!read_int(root, "width", cfg.width, err) || !read_int(root, "height", cfg.height, err))
      return false;

    const auto palette = root.find("palette");
    if (palette != root.end() && !read_palette(*palette, cfg.palette, err))
      return false;

    const auto scene = root.find("scene");
    if (scene != root.end())
    {
      if (!scene->is_array())
      {
        err = "\"scene\" must be an array";
        return false;
      }
      cfg.scene.reserve(scene->size());
      for (size_t i = 0; i < scene->size(); ++i)
      {
        DrawOp op;
        if (!read_op((*scene)[i], op, err))
        {
          err = "scene[" + std::to_string(i) + "]: " + err;
          return false;
        }
        cfg.scene.push_back(op);
      }
    }

    if (!validate_scene(cfg, err))
      return false;
    out = std::move(cfg);
    return true;
  }

  bool load_scene_json(const std::string &path, SceneConfig &out, std::string &err)
  {
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes, err))
    {
      err = path + ": " + err;
      return false;
    }
    return parse_scene_json(std::string(bytes.begin(), bytes.end()), out, err);
  }

  std::string dump_scene_json(const SceneConfig &config, int indent)
  {
    json root;
    root["width"] = config.width;
    root["height"] = config.height;

    json palette = json::object();
    for (PaletteSlot slot : {PaletteSlot::Background, PaletteSlot::Accent, PaletteSlot::Highlight, PaletteSlot::Shadow})
    {
      const Color &c = config.palette.get(slot);
      palette[slot_name(slot)] = json::array({c.r, c.g, c.b});
    }
    root["palette"] = palette;

    json scene = json::array();
    for (const DrawOp &op : config.scene)
      scene.push_back(op_to_json(op));
    root["scene"] = scene;
    return root.dump(indent);
  }
} // namespace icongen
