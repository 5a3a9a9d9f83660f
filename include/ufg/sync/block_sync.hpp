/**
 * @file block_sync.hpp
 * @brief uniform-group glue: filter + order fields, plan, bake, cache, sync uwu
 *
 * this is where the planner and the procedure builder meet real inputs. a
 * UniformBufferGroup carries the current values plus the packed buffer that
 * will be uploaded; ProgramUniforms is what shader reflection says the block
 * declares. only names present in both make it into the layout (a uniform
 * without a value is simply skipped), ordered by ascending reflection index.
 *
 * the SyncCache keys baked procedures by the ordered (name, type) shape, so
 * every group with the same shape shares one immutable GeneratedSync. readers
 * take a shared lock; a miss builds outside the map and publishes under an
 * exclusive lock. published entries are never mutated.
 *
 * example (per-frame loop):
 * @code
 * ufg::sync::SyncCache cache;
 * ufg::gpu::HostMirrorUploader uploader;
 * group.uniforms.set("uTime", 3.5F);
 * if (auto synced = ufg::sync::sync_group(cache, group, program, uploader); !synced) {
 *     // synced.error().message explains what went sideways
 * }
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "ufg/gpu/uniform_buffer.hpp"
#include "ufg/layout/planner.hpp"
#include "ufg/layout/uniform_types.hpp"
#include "ufg/sync/procedure.hpp"
#include "ufg/sync/values.hpp"

namespace ufg::sync
{

/**
 * @brief reflection descriptor of one uniform declared by a program
 */
struct UniformData
{
    std::string         name;
    layout::UniformType type;
    std::uint32_t       size{1U};  ///< array size from reflection
    std::uint32_t       index{0U}; ///< update/binding order
};

using ProgramUniforms = std::unordered_map<std::string, UniformData>;

/**
 * @brief current values + packed buffer for one uniform block instance
 */
struct UniformBufferGroup
{
    ValueTable         uniforms;
    gpu::UniformBuffer buffer;
};

/**
 * @brief layout + baked procedure for one block shape (immutable once published)
 */
struct GeneratedSync
{
    std::string                          signature;
    std::vector<layout::FieldDescriptor> fields;
    layout::BlockLayout                  layout;
    SyncProcedure                        procedure;
};

/**
 * @brief pick the fields a group actually syncs, in binding order
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return descriptors for names present in both @p group.uniforms and
 *         @p program, sorted by ascending index (name breaks ties)
 */
[[nodiscard]] auto collect_fields(const UniformBufferGroup &group, const ProgramUniforms &program)
    -> std::vector<layout::FieldDescriptor>;

/**
 * @brief cache key for an ordered field list ("name:type;name:type;...")
 */
[[nodiscard]] auto shape_signature(std::span<const layout::FieldDescriptor> fields) -> std::string;

/**
 * @brief plan + bake a procedure for @p group and reset its buffer to the planned size
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (replaces @p group.buffer contents with zeros)
 *
 * @return GeneratedSync or LayoutError (arrays rejected before anything is allocated)
 */
[[nodiscard]] auto generate_uniform_buffer_sync(UniformBufferGroup &group, const ProgramUniforms &program)
    -> std::expected<GeneratedSync, layout::LayoutError>;

/**
 * @brief shape-keyed store of baked procedures, safe for concurrent readers
 */
class SyncCache
{
public:
    SyncCache() = default;

    SyncCache(const SyncCache &)                     = delete;
    auto operator=(const SyncCache &) -> SyncCache & = delete;

    /**
     * @brief fetch (or build and publish) the procedure matching @p group's shape
     *
     * ⚠️ IMPURE FUNCTION ⚠️ (may resize @p group.buffer when its size does
     * not match the cached layout, and may insert into the cache)
     */
    [[nodiscard]] auto get_or_build(UniformBufferGroup &group, const ProgramUniforms &program)
        -> std::expected<std::shared_ptr<const GeneratedSync>, layout::LayoutError>;

    [[nodiscard]] auto find(const std::string &signature) const -> std::shared_ptr<const GeneratedSync>;
    [[nodiscard]] auto size() const -> std::size_t;
    void clear();

private:
    mutable std::shared_mutex                                              mutex_;
    std::unordered_map<std::string, std::shared_ptr<const GeneratedSync>> entries_;
};

/**
 * @brief error from sync_group: either building the procedure or running it failed
 */
struct GroupSyncError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief per-frame entry point: resolve the cached procedure and run it
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (writes @p group.buffer and calls @p uploader once)
 */
[[nodiscard]] auto sync_group(SyncCache &cache, UniformBufferGroup &group, const ProgramUniforms &program,
                              gpu::BufferUploader &uploader) -> std::expected<void, GroupSyncError>;

} // namespace ufg::sync
