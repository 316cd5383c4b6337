#pragma once

/**
 * @file VImage.h
 * @brief 8-bit raster image (Gray / RGB / RGBA)
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace Vx::Trace {

/**
 * @brief Raster image consumed by the vectorization pipeline
 *
 * Key features:
 * - Gray, RGB or RGBA 8-bit samples
 * - 64-byte row alignment
 * - Shallow copy by default, Clone() for deep copy
 *
 * The pipeline treats its input as immutable; every stage writes into new
 * buffers.
 */
class VXTRACE_API VImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    VImage();

    /// Create zero-filled image with specified dimensions
    VImage(int32_t width, int32_t height, ChannelType channels = ChannelType::Gray);

    VImage(const VImage& other);
    VImage(VImage&& other) noexcept;
    ~VImage();
    VImage& operator=(const VImage& other);
    VImage& operator=(VImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create from tightly packed pixel data (copies data)
     * @param data Pixel buffer, row-major, no padding
     * @param length Buffer length in bytes
     * @throws InvalidArgumentException on non-positive dimensions or
     *         length != width * height * channels
     */
    static VImage FromBuffer(const uint8_t* data, size_t length,
                             int32_t width, int32_t height,
                             ChannelType channels);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Width() const;
    int32_t Height() const;
    int Channels() const;
    ChannelType GetChannelType() const;

    /// Row stride in bytes (includes alignment padding)
    size_t Stride() const;

    bool Empty() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    uint8_t* Data();
    const uint8_t* Data() const;

    uint8_t* RowPtr(int32_t row);
    const uint8_t* RowPtr(int32_t row) const;

    /// First channel at (x, y)
    uint8_t At(int32_t x, int32_t y) const;

    /// Set first channel at (x, y)
    void SetAt(int32_t x, int32_t y, uint8_t value);

    /// Pixel as RGBA regardless of layout (gray replicated, alpha 255 if absent)
    Color PixelColor(int32_t x, int32_t y) const;

    /// Write an RGBA color into the pixel (converted to the image layout)
    void SetPixelColor(int32_t x, int32_t y, const Color& color);

    // =========================================================================
    // Operations
    // =========================================================================

    /// Deep copy
    VImage Clone() const;

    /// Copy converted to RGBA
    VImage ToRgba() const;

    /**
     * @brief Luminance plane (tightly packed, width*height)
     *
     * Transparent pixels are composited over white first.
     */
    std::vector<uint8_t> Luminance() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Vx::Trace
