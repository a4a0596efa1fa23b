/**
 * @file rom_format.hpp
 * @brief Byte signatures of the NVIDIA option-ROM layout
 *
 * Every value here is a whole-byte literal or a whole-byte count. Literals
 * are stored as lowercase hex text since all matching happens on the hex
 * view of the image.
 *
 * Layout of the region that gets spliced out:
 *
 *   55aa ?? eb ????????????????????  564944454f ... 564e <gap1> 4e504453 <gap2> 4e504445
 *   |-- PCI expansion ROM header --| "VIDEO"        "VN"       "NPDS"           "NPDE"
 *   ^ header offset                                 ^ footer offset
 */

#ifndef VBIOS_ROM_FORMAT_HPP
#define VBIOS_ROM_FORMAT_HPP

#include <cstddef>
#include <string_view>

namespace vbios {

// =============================================================================
// HEADER ANCHOR
// =============================================================================

/**
 * @brief PCI expansion ROM signature, first two bytes of the header
 */
constexpr std::string_view HEADER_MAGIC = "55aa";

/**
 * @brief Bytes between the magic and the jump opcode (ROM size in 512 byte units)
 */
constexpr size_t HEADER_SIZE_FIELD_BYTES = 1;

/**
 * @brief x86 short jump opcode into the init entry point
 */
constexpr std::string_view HEADER_JUMP = "eb";

/**
 * @brief Jump displacement and reserved bytes before the "VIDEO" tag
 */
constexpr size_t HEADER_RESERVED_BYTES = 10;

/**
 * @brief ASCII "VIDEO"
 */
constexpr std::string_view HEADER_VIDEO_TAG = "564944454f";

// =============================================================================
// FOOTER ANCHOR
// =============================================================================

/**
 * @brief ASCII "VN", leading anchor of every footer layout
 */
constexpr std::string_view FOOTER_ANCHOR = "564e";

/**
 * @brief Distance between the NPDS marker and the trailing NPDE marker.
 * Identical for every known generation.
 */
constexpr size_t FOOTER_SECOND_GAP_BYTES = 28;

// =============================================================================
// INTERNAL MARKERS
// =============================================================================

/**
 * @brief ASCII "NPDS", NVIDIA PCI data structure
 */
constexpr std::string_view NPDS_MARKER = "4e504453";

/**
 * @brief ASCII "NPDE", NVIDIA PCI data extension
 */
constexpr std::string_view NPDE_MARKER = "4e504445";

/**
 * @brief Marker counts required between header and footer for a
 * UEFI capable image
 */
constexpr size_t EXPECTED_NPDS_COUNT = 1;
constexpr size_t EXPECTED_NPDE_COUNT = 3;
constexpr size_t EXPECTED_NPDE_AFTER_NPDS = 2;

} // namespace vbios

#endif // VBIOS_ROM_FORMAT_HPP
