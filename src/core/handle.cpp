/// @file handle.cpp
/// @brief Handle system implementation for lumen_core
///
/// The handle system is header-only apart from debug formatting.

#include <lumen/core/handle.hpp>
#include <iomanip>
#include <sstream>

namespace lumen_core {

namespace debug {

std::string format_handle_bits(std::uint64_t bits) {
    if (bits == handle_constants::NULL_BITS) {
        return "Handle(null)";
    }

    auto index = static_cast<std::uint32_t>(bits & 0xFFFFFFFFull);
    auto generation = static_cast<std::uint32_t>(bits >> 32);

    std::ostringstream oss;
    oss << "Handle(idx=" << index << ", gen=" << generation
        << ", bits=0x" << std::hex << std::setfill('0') << std::setw(16) << bits << ")";
    return oss.str();
}

} // namespace debug

} // namespace lumen_core
