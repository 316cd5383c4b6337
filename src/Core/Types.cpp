/**
 * @file Types.cpp
 * @brief Colour hex formatting
 */

#include <VxTrace/Core/Types.h>

#include <fmt/format.h>

namespace Vx::Trace {

std::string Color::ToHex() const {
    return fmt::format("#{:02x}{:02x}{:02x}", r, g, b);
}

} // namespace Vx::Trace
