#pragma once

/**
 * @file ImageIO.h
 * @brief Raster file decode/encode (stb_image), built as vxtrace_io
 *
 * Supported read formats: PNG, JPEG, BMP, TGA, PGM/PPM, GIF (first frame)
 * Supported write formats: PNG, BMP
 */

#include <VxTrace/Core/Export.h>
#include <VxTrace/Core/VImage.h>

#include <string>

namespace Vx::Trace::IO {

/**
 * @brief Decode an 8-bit image file
 * @throws IOException when the file cannot be decoded
 * @throws UnsupportedException on channel counts other than 1, 3, 4
 */
VImage ReadImage(const std::string& path);

/**
 * @brief Encode by extension (.png or .bmp, anything else is PNG)
 * @return False when stb could not write the file
 */
bool WriteImage(const VImage& image, const std::string& path);

} // namespace Vx::Trace::IO
