#include "io/image_loader.h"

#include <climits>
#include <cstring>
#include <utility>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace rustique::image_loader
{
namespace
{
static std::string StbReason(const char* prefix)
{
    const char* reason = stbi_failure_reason();
    return std::string(prefix) + (reason ? reason : "unknown error");
}
} // namespace

bool DecodeRgba8(const std::vector<std::uint8_t>& encoded, int max_dimension, DecodedImage& out, std::string& err)
{
    err.clear();
    if (encoded.empty() || encoded.size() > (size_t)INT_MAX)
    {
        err = "Invalid image buffer size.";
        return false;
    }
    const int len = (int)encoded.size();

    int w = 0, h = 0, channels_in_file = 0;
    if (!stbi_info_from_memory(encoded.data(), len, &w, &h, &channels_in_file))
    {
        err = StbReason("Unrecognised image data: ");
        return false;
    }
    if (w <= 0 || h <= 0 || w > max_dimension || h > max_dimension)
    {
        err = "Image is " + std::to_string(w) + "x" + std::to_string(h) + "; the limit is " +
              std::to_string(max_dimension) + " per side.";
        return false;
    }

    // Force 4 channels so every source format comes out as RGBA8.
    unsigned char* data = stbi_load_from_memory(encoded.data(), len, &w, &h, &channels_in_file, 4);
    if (!data)
    {
        err = StbReason("Failed to decode image: ");
        return false;
    }

    DecodedImage img;
    img.width = w;
    img.height = h;
    img.rgba.resize((size_t)w * (size_t)h * 4u);
    std::memcpy(img.rgba.data(), data, img.rgba.size());
    stbi_image_free(data);

    out = std::move(img);
    return true;
}
} // namespace rustique::image_loader
