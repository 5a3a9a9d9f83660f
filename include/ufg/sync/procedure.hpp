/**
 * @file procedure.hpp
 * @brief per-shape sync procedures: precomputed copy rules instead of per-frame type dispatch uwu
 *
 * once a block's field list is planned, the set of fields and their types is
 * frozen. build_sync_procedure bakes that into an ordered list of copy steps
 * (scalar / vector / matrix, each with its word offset and component count),
 * so the per-frame path is "look up value, copy N words" for every field with
 * no type switch in between. one procedure serves every block that shares
 * the same ordered (name, type) shape.
 *
 * invoking the procedure rewrites every planned range of the target buffer
 * and then calls the uploader exactly once. validation runs first, so a
 * missing value never leaves a half-written buffer behind.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "ufg/gpu/uniform_buffer.hpp"
#include "ufg/layout/planner.hpp"
#include "ufg/layout/uniform_types.hpp"
#include "ufg/sync/values.hpp"

namespace ufg::sync
{

/// copy one component to @c offset (offsets are in 32-bit words)
struct ScalarCopy
{
    std::uint32_t offset;
};

/// copy @c count contiguous components starting at @c offset
struct VectorCopy
{
    std::uint32_t offset;
    std::uint32_t count;
};

/// copy all N*N matrix components in source order starting at @c offset
struct MatrixCopy
{
    std::uint32_t offset;
    std::uint32_t count;
};

using CopyRule = std::variant<ScalarCopy, VectorCopy, MatrixCopy>;

/**
 * @brief one baked field copy: value-table key + encoding + rule
 */
struct CopyStep
{
    std::string           name;
    layout::ComponentKind kind;
    CopyRule              rule;
};

/**
 * @brief failure while running a sync procedure (missing value, short value, upload)
 */
struct SyncError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief first word written by a rule
 */
[[nodiscard]] auto rule_offset(const CopyRule &rule) noexcept -> std::uint32_t;

/**
 * @brief number of words written by a rule
 */
[[nodiscard]] auto rule_count(const CopyRule &rule) noexcept -> std::uint32_t;

/**
 * @brief specialised, immutable copy routine for one block shape
 */
class SyncProcedure
{
public:
    SyncProcedure() = default;

    SyncProcedure(std::vector<CopyStep> steps, std::uint32_t size_bytes);

    /**
     * @brief copy current values into @p target and upload it
     *
     * ⚠️ IMPURE FUNCTION ⚠️ (writes into the borrowed buffer and calls the uploader)
     *
     * @param[in] values current value table
     * @param[in,out] target packed buffer, must hold at least size_bytes()
     * @param[in,out] uploader receives exactly one update() on success
     * @return empty on success; SyncError when a value is missing, too short, or
     *         holds a float that an int/uint slot cannot represent
     *         (nothing written), or when the upload fails (context "upload")
     */
    auto operator()(const ValueTable &values, gpu::UniformBuffer &target, gpu::BufferUploader &uploader) const
        -> std::expected<void, SyncError>;

    [[nodiscard]] auto steps() const noexcept -> std::span<const CopyStep> { return steps_; }
    [[nodiscard]] auto size_bytes() const noexcept -> std::uint32_t { return size_bytes_; }

private:
    std::vector<CopyStep> steps_;
    std::uint32_t         size_bytes_{0U};
};

/**
 * @brief bake a sync procedure from a planned layout
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] layout result of plan_layout for @p fields
 * @param[in] fields the same ordered descriptors the layout was planned from
 * @return SyncProcedure, LayoutError{UnsupportedFeature} for array fields, or
 *         LayoutError{UnknownType} when layout and descriptors disagree
 */
[[nodiscard]] auto build_sync_procedure(const layout::BlockLayout &layout,
                                        std::span<const layout::FieldDescriptor> fields)
    -> std::expected<SyncProcedure, layout::LayoutError>;

} // namespace ufg::sync
