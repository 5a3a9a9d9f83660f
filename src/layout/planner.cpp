/**
 * @file planner.cpp
 * @brief std140 chunk planning (16-byte chunk bookkeeping, padding credits)
 */

#include "ufg/layout/planner.hpp"

#include <numeric>
#include <utility>

namespace ufg::layout
{

auto reject_array_fields(std::span<const FieldDescriptor> fields) -> std::expected<void, LayoutError>
{
    for (const auto &field : fields)
    {
        if (field.array_size != 1U)
        {
            return std::unexpected(LayoutError{LayoutErrorCode::UnsupportedFeature,
                                               "uniform block arrays not supported",
                                               {field.name, "array_size=" + std::to_string(field.array_size)}});
        }
    }
    return {};
}

/**
 * @details chunk_remaining always equals kChunkBytes - (offset % kChunkBytes)
 * when offset is mid-chunk, and kChunkBytes when offset sits on a boundary.
 * entries are addressed by index because padding discovered while placing
 * entry i is credited to entry i - 1.
 */
auto plan_layout(std::span<const FieldDescriptor> fields) -> std::expected<BlockLayout, LayoutError>
{
    if (auto arrays = reject_array_fields(fields); !arrays)
    {
        return std::unexpected(std::move(arrays.error()));
    }

    BlockLayout layout{};
    layout.entries.resize(fields.size());

    std::uint32_t chunk_remaining = kChunkBytes;
    std::uint32_t offset          = 0U;

    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        const auto size = std140_size(fields[i].type);

        if (size > chunk_remaining && chunk_remaining < kChunkBytes)
        {
            // partially used chunk cannot hold this field, jump to the next boundary
            offset += chunk_remaining;
            if (i > 0U)
            {
                layout.entries[i - 1U].chunk_length_bytes += chunk_remaining;
            }
            chunk_remaining = kChunkBytes;
            if (size < kChunkBytes)
            {
                chunk_remaining -= size;
            }
        }
        else if (size > chunk_remaining)
        {
            // fresh chunk, field spans whole chunks (matrices)
        }
        else if (size == chunk_remaining)
        {
            chunk_remaining = kChunkBytes;
        }
        else
        {
            chunk_remaining -= size;
        }

        auto &entry              = layout.entries[i];
        entry.field              = fields[i];
        entry.offset_bytes       = offset;
        entry.data_length_bytes  = size;
        entry.chunk_length_bytes = size;
        entry.dirty              = 0U;

        offset += size;
    }

    if (offset % kChunkBytes != 0U)
    {
        layout.entries.back().chunk_length_bytes += chunk_remaining;
        offset += chunk_remaining;
    }

    layout.total_size_bytes = offset;
    return layout;
}

auto padding_bytes(const BlockLayout &layout) noexcept -> std::uint32_t
{
    const auto data = std::accumulate(layout.entries.begin(), layout.entries.end(), std::uint32_t{0U},
                                      [](std::uint32_t sum, const LayoutEntry &entry) {
                                          return sum + entry.data_length_bytes;
                                      });
    return layout.total_size_bytes - data;
}

} // namespace ufg::layout
