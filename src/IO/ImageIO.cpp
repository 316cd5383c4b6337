/**
 * @file ImageIO.cpp
 * @brief Image file loading and saving through stb
 */

#include <VxTrace/IO/ImageIO.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Platform/Log.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Vx::Trace::IO {

namespace {

std::string LowerExtension(const std::string& path) {
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // anonymous namespace

VImage ReadImage(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    std::unique_ptr<uint8_t, void (*)(void*)> data(
        stbi_load(path.c_str(), &w, &h, &channels, 0), stbi_image_free);
    if (!data) {
        throw IOException("Failed to load image: " + path);
    }

    ChannelType type;
    switch (channels) {
        case 1: type = ChannelType::Gray; break;
        case 3: type = ChannelType::RGB; break;
        case 4: type = ChannelType::RGBA; break;
        default:
            throw UnsupportedException("Unsupported channel count: " + std::to_string(channels));
    }

    const size_t length = static_cast<size_t>(w) * h * channels;
    VImage image = VImage::FromBuffer(data.get(), length, w, h, type);

    Platform::Log::Debug("read {} ({}x{}, {} channels)", path, w, h, channels);
    return image;
}

bool WriteImage(const VImage& image, const std::string& path) {
    if (image.Empty()) return false;

    const int w = image.Width();
    const int h = image.Height();
    const int c = image.Channels();

    // stb wants tightly packed rows
    std::vector<uint8_t> packed(static_cast<size_t>(w) * h * c);
    for (int y = 0; y < h; ++y) {
        std::memcpy(packed.data() + static_cast<size_t>(y) * w * c, image.RowPtr(y),
                    static_cast<size_t>(w) * c);
    }

    if (LowerExtension(path) == "bmp") {
        return stbi_write_bmp(path.c_str(), w, h, c, packed.data()) != 0;
    }
    return stbi_write_png(path.c_str(), w, h, c, packed.data(), w * c) != 0;
}

} // namespace Vx::Trace::IO
