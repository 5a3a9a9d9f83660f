/**
 * @file uniform_types.cpp
 * @brief lookups over the closed std140 type table
 */

#include "ufg/layout/uniform_types.hpp"

#include <stdexcept>

namespace ufg::layout
{

auto traits(const UniformType type) -> const TypeTraits &
{
    const auto index = static_cast<std::size_t>(type);
    if (index >= kTypeTable.size())
    {
        throw std::logic_error("uniform type outside the closed type table: " + std::to_string(index));
    }
    return kTypeTable[index];
}

auto std140_size(const UniformType type) -> std::uint32_t
{
    return traits(type).std140_size;
}

auto to_string(const UniformType type) -> std::string_view
{
    return traits(type).glsl_name;
}

auto parse_uniform_type(std::string_view glsl_name) -> std::expected<UniformType, LayoutError>
{
    for (std::size_t i = 0; i < kTypeTable.size(); ++i)
    {
        if (kTypeTable[i].glsl_name == glsl_name)
        {
            return static_cast<UniformType>(i);
        }
    }
    return std::unexpected(LayoutError{LayoutErrorCode::UnknownType,
                                       "unknown uniform type '" + std::string{glsl_name} + "'",
                                       {"type"}});
}

} // namespace ufg::layout
