#include "image_io.h"
#include "png_encoder.h"
#include "scene.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

static void print_usage()
{
  std::cerr << "Usage: icongen [output.png] [--scene=<file.json>] [--dump-scene] [--verify]\n"
            << "  output.png        destination (default: assets/icon.png)\n"
            << "  --scene=<path>    load canvas size, palette and draw operations from JSON\n"
            << "  --dump-scene      print the effective scene as JSON and exit\n"
            << "  --verify          decode the written file with libpng and compare pixels\n";
}

// Round-trip the encoded bytes through libpng and compare with the rendered canvas.
static bool verify_output(const std::vector<uint8_t> &png_bytes, const icongen::PixelBuffer &expected, std::string &err)
{
  icongen::PixelBuffer decoded;
  if (!icongen::decode_png(png_bytes, decoded, err))
    return false;
  if (decoded.width != expected.width || decoded.height != expected.height)
  {
    err = "decoded size " + std::to_string(decoded.width) + "x" + std::to_string(decoded.height) +
          " does not match " + std::to_string(expected.width) + "x" + std::to_string(expected.height);
    return false;
  }
  for (size_t i = 0; i < expected.data.size(); i += 4)
  {
    if (decoded.data[i + 0] != expected.data[i + 0] || decoded.data[i + 1] != expected.data[i + 1] ||
        decoded.data[i + 2] != expected.data[i + 2] || decoded.data[i + 3] != expected.data[i + 3])
    {
      const size_t p = i / 4;
      err = "pixel mismatch at (" + std::to_string(p % expected.width) + ", " + std::to_string(p / expected.width) + ")";
      return false;
    }
  }
  return true;
}

int main(int argc, char **argv)
{
  std::string out_path = "assets/icon.png";
  std::string scene_path;
  bool dump_scene = false;
  bool verify = false;
  bool have_output = false;

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help")
    {
      print_usage();
      return 0;
    }
    else if (arg.rfind("--scene=", 0) == 0)
    {
      scene_path = arg.substr(8);
      if (scene_path.empty())
      {
        std::cerr << "Invalid --scene option\n";
        return 2;
      }
    }
    else if (arg == "--dump-scene")
    {
      dump_scene = true;
    }
    else if (arg == "--verify")
    {
      verify = true;
    }
    else if (!arg.empty() && arg[0] != '-' && !have_output)
    {
      out_path = arg;
      have_output = true;
    }
    else
    {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  std::string err;
  icongen::SceneConfig config = icongen::default_icon_scene();
  if (!scene_path.empty() && !icongen::load_scene_json(scene_path, config, err))
  {
    std::cerr << "Failed to load scene: " << err << "\n";
    return 1;
  }

  if (dump_scene)
  {
    std::cout << icongen::dump_scene_json(config) << "\n";
    return 0;
  }

  icongen::PixelBuffer pixels;
  if (!icongen::render_scene(config, pixels, err))
  {
    std::cerr << "Invalid scene: " << err << "\n";
    return 1;
  }

  std::vector<uint8_t> png_bytes;
  if (!icongen::encode_png(pixels, png_bytes, err))
  {
    std::cerr << "Failed to encode: " << err << "\n";
    return 1;
  }

  if (!icongen::write_file(out_path, png_bytes, err))
  {
    std::cerr << "Failed to save output: " << out_path << ": " << err << "\n";
    return 1;
  }

  if (verify && !verify_output(png_bytes, pixels, err))
  {
    std::cerr << "Verification failed: " << err << "\n";
    return 1;
  }

  std::cout << "Icon written to " << out_path << " (" << png_bytes.size() << " bytes)\n";
  return 0;
}
