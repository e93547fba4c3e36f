#include "io/image_writer.h"

#include <algorithm>

// stb_image_write implementation must live in exactly one translation unit.
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace rustique::image_writer
{
namespace
{
static bool CheckBuffer(int width, int height, const std::vector<std::uint8_t>& rgba, std::string& err)
{
    if (width <= 0 || height <= 0)
    {
        err = "Invalid image dimensions.";
        return false;
    }
    if (rgba.size() < (size_t)width * (size_t)height * 4u)
    {
        err = "Invalid RGBA buffer size.";
        return false;
    }
    return true;
}
} // namespace

bool WriteJpgFromRgba32(const std::string& path,
                        int width,
                        int height,
                        const std::vector<std::uint8_t>& rgba,
                        int quality,
                        std::string& err)
{
    err.clear();
    if (!CheckBuffer(width, height, rgba, err))
        return false;

    const size_t count = (size_t)width * (size_t)height;
    std::vector<std::uint8_t> rgb(count * 3u);
    for (size_t i = 0; i < count; ++i)
    {
        rgb[i * 3u + 0] = rgba[i * 4u + 0];
        rgb[i * 3u + 1] = rgba[i * 4u + 1];
        rgb[i * 3u + 2] = rgba[i * 4u + 2];
    }

    if (!stbi_write_jpg(path.c_str(), width, height, 3, rgb.data(), std::clamp(quality, 1, 100)))
    {
        err = "stbi_write_jpg() failed for '" + path + "'.";
        return false;
    }
    return true;
}

bool WriteBmpFromRgba32(const std::string& path,
                        int width,
                        int height,
                        const std::vector<std::uint8_t>& rgba,
                        std::string& err)
{
    err.clear();
    if (!CheckBuffer(width, height, rgba, err))
        return false;

    if (!stbi_write_bmp(path.c_str(), width, height, 4, rgba.data()))
    {
        err = "stbi_write_bmp() failed for '" + path + "'.";
        return false;
    }
    return true;
}
} // namespace rustique::image_writer
