/**
 * @file procedure.cpp
 * @brief copy-rule baking and execution for sync procedures
 */

#include "ufg/sync/procedure.hpp"

#include <type_traits>
#include <utility>

namespace ufg::sync
{
namespace
{

[[nodiscard]] auto make_rule(const layout::LayoutEntry &entry, const layout::TypeTraits &type) -> CopyRule
{
    const auto offset = layout::word_offset(entry);
    switch (type.shape)
    {
    case layout::TypeShape::Scalar:
        return ScalarCopy{offset};
    case layout::TypeShape::Vector:
        return VectorCopy{offset, type.components};
    case layout::TypeShape::Matrix:
        return MatrixCopy{offset, type.components};
    }
    return ScalarCopy{offset};
}

} // namespace

auto rule_offset(const CopyRule &rule) noexcept -> std::uint32_t
{
    return std::visit([](const auto &held) { return held.offset; }, rule);
}

auto rule_count(const CopyRule &rule) noexcept -> std::uint32_t
{
    if (std::holds_alternative<ScalarCopy>(rule))
    {
        return 1U;
    }
    if (const auto *vector = std::get_if<VectorCopy>(&rule))
    {
        return vector->count;
    }
    return std::get<MatrixCopy>(rule).count;
}

SyncProcedure::SyncProcedure(std::vector<CopyStep> steps, const std::uint32_t size_bytes)
    : steps_{std::move(steps)},
      size_bytes_{size_bytes}
{
}

auto SyncProcedure::operator()(const ValueTable &values, gpu::UniformBuffer &target,
                               gpu::BufferUploader &uploader) const -> std::expected<void, SyncError>
{
    if (target.size_bytes() < size_bytes_)
    {
        return std::unexpected(SyncError{"target buffer smaller than block layout",
                                         {"size_bytes=" + std::to_string(target.size_bytes()),
                                          "required=" + std::to_string(size_bytes_)}});
    }

    for (const auto &step : steps_)
    {
        const auto *value = values.find(step.name);
        if (value == nullptr)
        {
            return std::unexpected(SyncError{"missing value for uniform", {step.name}});
        }
        if (component_count(*value) < rule_count(step.rule))
        {
            return std::unexpected(SyncError{"value has fewer components than its uniform type",
                                             {step.name,
                                              "components=" + std::to_string(component_count(*value)),
                                              "required=" + std::to_string(rule_count(step.rule))}});
        }
        for (std::uint32_t i = 0; i < rule_count(step.rule); ++i)
        {
            if (!component_fits(*value, i, step.kind))
            {
                return std::unexpected(SyncError{"value component not representable in its uniform type",
                                                 {step.name, "component=" + std::to_string(i)}});
            }
        }
    }

    auto data = target.data();
    for (const auto &step : steps_)
    {
        const auto &value = *values.find(step.name);
        std::visit(
            [&](const auto &rule) {
                if constexpr (std::is_same_v<std::decay_t<decltype(rule)>, ScalarCopy>)
                {
                    data[rule.offset] = encode_component(value, 0U, step.kind);
                }
                else
                {
                    for (std::uint32_t i = 0; i < rule.count; ++i)
                    {
                        data[rule.offset + i] = encode_component(value, i, step.kind);
                    }
                }
            },
            step.rule);
    }
    target.mark_updated();

    if (auto uploaded = uploader.update(target); !uploaded)
    {
        auto context = std::move(uploaded.error().context);
        context.insert(context.begin(), "upload");
        return std::unexpected(SyncError{std::move(uploaded.error().message), std::move(context)});
    }
    return {};
}

auto build_sync_procedure(const layout::BlockLayout &layout, std::span<const layout::FieldDescriptor> fields)
    -> std::expected<SyncProcedure, layout::LayoutError>
{
    if (auto arrays = layout::reject_array_fields(fields); !arrays)
    {
        return std::unexpected(std::move(arrays.error()));
    }
    if (layout.entries.size() != fields.size())
    {
        return std::unexpected(layout::LayoutError{layout::LayoutErrorCode::UnknownType,
                                                   "layout does not match field list",
                                                   {"entries=" + std::to_string(layout.entries.size()),
                                                    "fields=" + std::to_string(fields.size())}});
    }

    std::vector<CopyStep> steps;
    steps.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        const auto &entry = layout.entries[i];
        const auto &field = fields[i];
        if (entry.field.name != field.name || entry.field.type != field.type)
        {
            return std::unexpected(layout::LayoutError{layout::LayoutErrorCode::UnknownType,
                                                       "layout entry does not match field",
                                                       {field.name, std::string{layout::to_string(field.type)}}});
        }

        const auto &type = layout::traits(field.type);
        steps.push_back(CopyStep{field.name, type.kind, make_rule(entry, type)});
    }

    return SyncProcedure{std::move(steps), layout.total_size_bytes};
}

} // namespace ufg::sync
