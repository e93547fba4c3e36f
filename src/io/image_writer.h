#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rustique::image_writer
{
// stb_image_write backed encoders. `rgba` is row-major RGBA8.
// JPEG output is RGB (alpha is dropped); quality is clamped to 1..100.
bool WriteJpgFromRgba32(const std::string& path,
                        int width,
                        int height,
                        const std::vector<std::uint8_t>& rgba,
                        int quality,
                        std::string& err);

// 32-bit BMP with alpha.
bool WriteBmpFromRgba32(const std::string& path,
                        int width,
                        int height,
                        const std::vector<std::uint8_t>& rgba,
                        std::string& err);
} // namespace rustique::image_writer
