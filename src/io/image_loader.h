#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rustique::image_loader
{
struct DecodedImage
{
    int                       width = 0;
    int                       height = 0;
    std::vector<std::uint8_t> rgba; // row-major, width * height * 4
};

// Decodes an encoded PNG/JPG/GIF (first frame)/BMP buffer with stb_image.
// Images wider or taller than `max_dimension` are refused from their header,
// before any pixel data is decoded. `out` is only written on success.
bool DecodeRgba8(const std::vector<std::uint8_t>& encoded, int max_dimension, DecodedImage& out, std::string& err);
} // namespace rustique::image_loader
