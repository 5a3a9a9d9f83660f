/**
 * @file planner.hpp
 * @brief std140 chunk planner: field list in, offsets + chunk footprints out uwu
 *
 * uniform blocks using layout(std140) are carved into 16-byte chunks. this
 * header computes, for an ordered list of uniform fields, where each field
 * starts, how many bytes of data it carries, and how many bytes of chunk it
 * effectively owns once trailing padding is credited back to it.
 *
 * the planner is deterministic and pure: same field list in, bit-identical
 * layout out. it never sorts, so callers must hand fields over in binding
 * order (ascending update index). reordering fields changes offsets and
 * invalidates any sync procedure built for the old order.
 *
 * example:
 * @code
 * using namespace ufg::layout;
 * const std::vector<FieldDescriptor> fields{
 *     {"uTint", UniformType::Float},
 *     {"uLightDir", UniformType::Vec3},
 * };
 * auto planned = plan_layout(fields);
 * // planned->entries[1].offset_bytes == 16, planned->total_size_bytes == 32
 * @endcode
 */
#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "ufg/layout/uniform_types.hpp"

namespace ufg::layout
{

/**
 * @brief immutable description of one named uniform slot
 */
struct FieldDescriptor
{
    std::string   name;              ///< unique within a block
    UniformType   type;              ///< closed type enum
    std::uint32_t array_size{1U};    ///< anything but 1 is rejected (arrays unsupported)
    std::uint32_t update_index{0U};  ///< ordering key, caller sorts by it

    auto operator==(const FieldDescriptor &) const -> bool = default;
};

/**
 * @brief planned placement of a single field inside the block
 */
struct LayoutEntry
{
    FieldDescriptor field;                  ///< descriptor this entry was planned from
    std::uint32_t   offset_bytes{0U};       ///< byte offset inside the block
    std::uint32_t   data_length_bytes{0U};  ///< std140 size of the field type
    std::uint32_t   chunk_length_bytes{0U}; ///< data length + padding credited after it
    std::uint32_t   dirty{0U};              ///< reserved for partial updates, always 0 today

    auto operator==(const LayoutEntry &) const -> bool = default;
};

/**
 * @brief complete block layout (entries in input order + total size)
 */
struct BlockLayout
{
    std::vector<LayoutEntry> entries;
    std::uint32_t            total_size_bytes{0U}; ///< always a multiple of kChunkBytes

    auto operator==(const BlockLayout &) const -> bool = default;
};

/**
 * @brief run the std140 chunk algorithm over an ordered field list
 *
 * ✨ PURE FUNCTION ✨
 *
 * walks the fields once, tracking how much of the current 16-byte chunk is
 * still free. a field that does not fit the partially used chunk pushes the
 * offset to the next boundary and the skipped bytes are credited to the
 * previous entry's chunk length. a final partial chunk is credited to the
 * last entry so the total lands on a chunk boundary.
 *
 * @param[in] fields fields in binding order (not sorted here)
 * @return BlockLayout or LayoutError{UnsupportedFeature} when any field has
 *         array_size != 1 (checked before any entry is planned)
 *
 * @post result.total_size_bytes % kChunkBytes == 0
 * @post result.total_size_bytes >= sum of data_length_bytes
 * @complexity O(n)
 */
[[nodiscard]] auto plan_layout(std::span<const FieldDescriptor> fields) -> std::expected<BlockLayout, LayoutError>;

/**
 * @brief reject array-typed fields (shared by planner and sync builder)
 *
 * @return empty on success, LayoutError{UnsupportedFeature} naming the first array field
 */
[[nodiscard]] auto reject_array_fields(std::span<const FieldDescriptor> fields) -> std::expected<void, LayoutError>;

/**
 * @brief bytes of padding inserted by the planner (total - sum of data lengths)
 */
[[nodiscard]] auto padding_bytes(const BlockLayout &layout) noexcept -> std::uint32_t;

/**
 * @brief entry offset expressed in 32-bit elements of the packed buffer
 */
[[nodiscard]] constexpr auto word_offset(const LayoutEntry &entry) noexcept -> std::uint32_t
{
    return entry.offset_bytes / 4U;
}

} // namespace ufg::layout
