/**
 * @file block_sync.cpp
 * @brief field collection, shape signatures, shared procedure cache
 */

#include "ufg/sync/block_sync.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "ufg/common/log.hpp"

namespace ufg::sync
{
namespace
{

void ensure_buffer_size(UniformBufferGroup &group, const std::uint32_t size_bytes)
{
    if (group.buffer.size_bytes() != size_bytes)
    {
        group.buffer.reset(size_bytes);
    }
}

} // namespace

auto collect_fields(const UniformBufferGroup &group, const ProgramUniforms &program)
    -> std::vector<layout::FieldDescriptor>
{
    std::vector<layout::FieldDescriptor> fields;
    fields.reserve(group.uniforms.size());
    for (const auto &name : group.uniforms.names())
    {
        const auto found = program.find(name);
        if (found == program.end())
        {
            continue;
        }
        const auto &data = found->second;
        fields.push_back(layout::FieldDescriptor{name, data.type, data.size, data.index});
    }

    std::sort(fields.begin(), fields.end(), [](const layout::FieldDescriptor &lhs, const layout::FieldDescriptor &rhs) {
        if (lhs.update_index != rhs.update_index)
        {
            return lhs.update_index < rhs.update_index;
        }
        return lhs.name < rhs.name;
    });
    return fields;
}

auto shape_signature(std::span<const layout::FieldDescriptor> fields) -> std::string
{
    std::string signature;
    for (const auto &field : fields)
    {
        signature += field.name;
        signature += ':';
        signature += layout::to_string(field.type);
        signature += ';';
    }
    return signature;
}

auto generate_uniform_buffer_sync(UniformBufferGroup &group, const ProgramUniforms &program)
    -> std::expected<GeneratedSync, layout::LayoutError>
{
    auto fields = collect_fields(group, program);

    auto planned = layout::plan_layout(fields);
    if (!planned)
    {
        return std::unexpected(std::move(planned.error()));
    }

    auto procedure = build_sync_procedure(*planned, fields);
    if (!procedure)
    {
        return std::unexpected(std::move(procedure.error()));
    }

    group.buffer.reset(planned->total_size_bytes);

    GeneratedSync generated{};
    generated.signature = shape_signature(fields);
    generated.fields    = std::move(fields);
    generated.layout    = std::move(*planned);
    generated.procedure = std::move(*procedure);
    return generated;
}

auto SyncCache::get_or_build(UniformBufferGroup &group, const ProgramUniforms &program)
    -> std::expected<std::shared_ptr<const GeneratedSync>, layout::LayoutError>
{
    const auto fields = collect_fields(group, program);

    // the signature ignores array sizes, so arrays must be refused before a lookup can hit
    if (auto arrays = layout::reject_array_fields(fields); !arrays)
    {
        return std::unexpected(std::move(arrays.error()));
    }

    const auto signature = shape_signature(fields);
    if (auto cached = find(signature))
    {
        ensure_buffer_size(group, cached->layout.total_size_bytes);
        return cached;
    }

    auto generated = generate_uniform_buffer_sync(group, program);
    if (!generated)
    {
        return std::unexpected(std::move(generated.error()));
    }

    auto published = std::make_shared<const GeneratedSync>(std::move(*generated));
    {
        std::unique_lock lock{mutex_};
        const auto [slot, inserted] = entries_.try_emplace(signature, published);
        if (!inserted)
        {
            // another thread published the same shape first, keep theirs
            published = slot->second;
        }
    }

    common::log_line("sync", "built procedure for '{}' ({} fields, {} bytes)", signature, published->fields.size(),
                     published->layout.total_size_bytes);
    ensure_buffer_size(group, published->layout.total_size_bytes);
    return published;
}

auto SyncCache::find(const std::string &signature) const -> std::shared_ptr<const GeneratedSync>
{
    std::shared_lock lock{mutex_};
    const auto found = entries_.find(signature);
    return found == entries_.end() ? nullptr : found->second;
}

auto SyncCache::size() const -> std::size_t
{
    std::shared_lock lock{mutex_};
    return entries_.size();
}

void SyncCache::clear()
{
    std::unique_lock lock{mutex_};
    entries_.clear();
}

auto sync_group(SyncCache &cache, UniformBufferGroup &group, const ProgramUniforms &program,
                gpu::BufferUploader &uploader) -> std::expected<void, GroupSyncError>
{
    const auto generated = cache.get_or_build(group, program);
    if (!generated)
    {
        return std::unexpected(GroupSyncError{generated.error().message, generated.error().context});
    }

    const auto &sync = **generated;
    if (auto synced = sync.procedure(group.uniforms, group.buffer, uploader); !synced)
    {
        auto context = std::move(synced.error().context);
        context.insert(context.begin(), sync.signature);
        return std::unexpected(GroupSyncError{std::move(synced.error().message), std::move(context)});
    }
    return {};
}

} // namespace ufg::sync
