/**
 * @file VImage.cpp
 * @brief Image storage, construction and pixel access
 */

#include <VxTrace/Core/VImage.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Core/Constants.h>
#include <VxTrace/Platform/Memory.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>

namespace Vx::Trace {

// =============================================================================
// Implementation class
// =============================================================================

class VImage::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    ChannelType channelType_ = ChannelType::Gray;
    size_t stride_ = 0;
    std::shared_ptr<uint8_t> data_;

    size_t BytesPerPixel() const {
        return static_cast<size_t>(ChannelCount(channelType_));
    }

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;

        stride_ = Platform::AlignedSize(static_cast<size_t>(w) * BytesPerPixel(),
                                        MEMORY_ALIGNMENT);
        size_t totalSize = stride_ * static_cast<size_t>(h);

        uint8_t* ptr = static_cast<uint8_t*>(
            Platform::AlignedAlloc(totalSize, MEMORY_ALIGNMENT));

        if (!ptr) {
            throw std::bad_alloc();
        }

        data_ = std::shared_ptr<uint8_t>(ptr, Platform::AlignedDeleter{});
        std::memset(ptr, 0, totalSize);
    }
};

// =============================================================================
// Constructors
// =============================================================================

VImage::VImage() : impl_(std::make_shared<Impl>()) {}

VImage::VImage(int32_t width, int32_t height, ChannelType channels)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }

    impl_->channelType_ = channels;
    impl_->Allocate(width, height);
}

VImage::VImage(const VImage& other) = default;
VImage::VImage(VImage&& other) noexcept = default;
VImage::~VImage() = default;
VImage& VImage::operator=(const VImage& other) = default;
VImage& VImage::operator=(VImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

VImage VImage::FromBuffer(const uint8_t* data, size_t length,
                          int32_t width, int32_t height,
                          ChannelType channels) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    if (data == nullptr) {
        throw InvalidArgumentException("Pixel buffer is null");
    }

    const size_t rowBytes = static_cast<size_t>(width) * ChannelCount(channels);
    const size_t expected = rowBytes * static_cast<size_t>(height);
    if (length != expected) {
        throw InvalidArgumentException("Pixel buffer length " + std::to_string(length) +
                                       " does not match " + std::to_string(width) + "x" +
                                       std::to_string(height) + "x" +
                                       std::to_string(ChannelCount(channels)) +
                                       " = " + std::to_string(expected));
    }

    VImage img(width, height, channels);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(img.RowPtr(y), data + static_cast<size_t>(y) * rowBytes, rowBytes);
    }
    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t VImage::Width() const { return impl_->width_; }
int32_t VImage::Height() const { return impl_->height_; }
int VImage::Channels() const { return ChannelCount(impl_->channelType_); }
ChannelType VImage::GetChannelType() const { return impl_->channelType_; }
size_t VImage::Stride() const { return impl_->stride_; }
bool VImage::Empty() const { return !impl_->data_ || impl_->width_ == 0 || impl_->height_ == 0; }

// =============================================================================
// Data Access
// =============================================================================

uint8_t* VImage::Data() { return impl_->data_.get(); }
const uint8_t* VImage::Data() const { return impl_->data_.get(); }

uint8_t* VImage::RowPtr(int32_t row) {
    return impl_->data_.get() + static_cast<size_t>(row) * impl_->stride_;
}

const uint8_t* VImage::RowPtr(int32_t row) const {
    return impl_->data_.get() + static_cast<size_t>(row) * impl_->stride_;
}

uint8_t VImage::At(int32_t x, int32_t y) const {
    return RowPtr(y)[static_cast<size_t>(x) * impl_->BytesPerPixel()];
}

void VImage::SetAt(int32_t x, int32_t y, uint8_t value) {
    RowPtr(y)[static_cast<size_t>(x) * impl_->BytesPerPixel()] = value;
}

Color VImage::PixelColor(int32_t x, int32_t y) const {
    const uint8_t* p = RowPtr(y) + static_cast<size_t>(x) * impl_->BytesPerPixel();
    switch (impl_->channelType_) {
        case ChannelType::Gray: return {p[0], p[0], p[0], 255};
        case ChannelType::RGB:  return {p[0], p[1], p[2], 255};
        case ChannelType::RGBA: return {p[0], p[1], p[2], p[3]};
    }
    return {};
}

void VImage::SetPixelColor(int32_t x, int32_t y, const Color& color) {
    uint8_t* p = RowPtr(y) + static_cast<size_t>(x) * impl_->BytesPerPixel();
    switch (impl_->channelType_) {
        case ChannelType::Gray:
            p[0] = static_cast<uint8_t>(std::lround(color.Luminance()));
            break;
        case ChannelType::RGB:
            p[0] = color.r; p[1] = color.g; p[2] = color.b;
            break;
        case ChannelType::RGBA:
            p[0] = color.r; p[1] = color.g; p[2] = color.b; p[3] = color.a;
            break;
    }
}

// =============================================================================
// Operations
// =============================================================================

VImage VImage::Clone() const {
    if (Empty()) return VImage();

    VImage copy(impl_->width_, impl_->height_, impl_->channelType_);
    std::memcpy(copy.Data(), Data(), impl_->stride_ * static_cast<size_t>(impl_->height_));
    return copy;
}

VImage VImage::ToRgba() const {
    if (Empty()) return VImage();
    if (impl_->channelType_ == ChannelType::RGBA) return Clone();

    VImage out(impl_->width_, impl_->height_, ChannelType::RGBA);
    for (int32_t y = 0; y < impl_->height_; ++y) {
        uint8_t* dst = out.RowPtr(y);
        for (int32_t x = 0; x < impl_->width_; ++x) {
            Color c = PixelColor(x, y);
            dst[4 * x + 0] = c.r;
            dst[4 * x + 1] = c.g;
            dst[4 * x + 2] = c.b;
            dst[4 * x + 3] = c.a;
        }
    }
    return out;
}

std::vector<uint8_t> VImage::Luminance() const {
    const int32_t w = impl_->width_;
    const int32_t h = impl_->height_;
    std::vector<uint8_t> gray(static_cast<size_t>(w) * h);

    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            Color c = PixelColor(x, y);
            double lum = c.Luminance();
            if (c.a < 255) {
                double alpha = c.a / 255.0;
                lum = lum * alpha + 255.0 * (1.0 - alpha);
            }
            gray[static_cast<size_t>(y) * w + x] =
                static_cast<uint8_t>(std::lround(std::min(255.0, std::max(0.0, lum))));
        }
    }
    return gray;
}

} // namespace Vx::Trace
