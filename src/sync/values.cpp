/**
 * @file values.cpp
 * @brief value table + component encoding into 32-bit slots
 */

#include "ufg/sync/values.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

namespace ufg::sync
{
namespace
{

/**
 * @brief true when @p component lies inside I's range (NaN never does)
 *
 * bounds are compared as double: every int32/uint32 limit is exact there
 */
template <typename I>
[[nodiscard]] auto float_in_range(const float component) noexcept -> bool
{
    const auto wide = static_cast<double>(component);
    return !std::isnan(component) && wide >= static_cast<double>(std::numeric_limits<I>::min()) &&
           wide <= static_cast<double>(std::numeric_limits<I>::max());
}

/**
 * @brief float -> integer conversion that saturates at I's limits, NaN becomes 0
 */
template <typename I>
[[nodiscard]] auto saturate_to(const float component) noexcept -> I
{
    if (std::isnan(component))
    {
        return I{0};
    }
    const auto wide = static_cast<double>(component);
    if (wide <= static_cast<double>(std::numeric_limits<I>::min()))
    {
        return std::numeric_limits<I>::min();
    }
    if (wide >= static_cast<double>(std::numeric_limits<I>::max()))
    {
        return std::numeric_limits<I>::max();
    }
    return static_cast<I>(component);
}

template <typename I, typename T>
[[nodiscard]] auto to_integer(const T component) noexcept -> I
{
    if constexpr (std::is_floating_point_v<T>)
    {
        return saturate_to<I>(component);
    }
    else
    {
        return static_cast<I>(component);
    }
}

template <typename T>
[[nodiscard]] auto encode_as(T component, const layout::ComponentKind kind) -> float
{
    switch (kind)
    {
    case layout::ComponentKind::Float:
        return static_cast<float>(component);
    case layout::ComponentKind::Int:
        return std::bit_cast<float>(to_integer<std::int32_t>(component));
    case layout::ComponentKind::Uint:
        return std::bit_cast<float>(to_integer<std::uint32_t>(component));
    case layout::ComponentKind::Bool:
        return std::bit_cast<float>(static_cast<std::uint32_t>(component != T{} ? 1U : 0U));
    }
    return static_cast<float>(component);
}

} // namespace

auto component_count(const UniformValue &value) noexcept -> std::size_t
{
    return std::visit(
        [](const auto &held) -> std::size_t {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_arithmetic_v<Held>)
            {
                return 1U;
            }
            else
            {
                return held.size();
            }
        },
        value);
}

auto component_fits(const UniformValue &value, const std::size_t index, const layout::ComponentKind kind) -> bool
{
    const float *held = std::get_if<float>(&value);
    if (held == nullptr)
    {
        if (const auto *floats = std::get_if<std::vector<float>>(&value))
        {
            held = &(*floats)[index];
        }
    }
    if (held == nullptr)
    {
        return true;
    }

    switch (kind)
    {
    case layout::ComponentKind::Int:
        return float_in_range<std::int32_t>(*held);
    case layout::ComponentKind::Uint:
        return float_in_range<std::uint32_t>(*held);
    case layout::ComponentKind::Float:
    case layout::ComponentKind::Bool:
        return true;
    }
    return true;
}

auto encode_component(const UniformValue &value, const std::size_t index, const layout::ComponentKind kind)
    -> float
{
    return std::visit(
        [index, kind](const auto &held) -> float {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<Held, bool>)
            {
                return encode_as(held ? 1U : 0U, kind);
            }
            else if constexpr (std::is_arithmetic_v<Held>)
            {
                return encode_as(held, kind);
            }
            else
            {
                return encode_as(held[index], kind);
            }
        },
        value);
}

void ValueTable::set(std::string_view name, UniformValue value)
{
    const auto found = values_.find(name);
    if (found != values_.end())
    {
        found->second = std::move(value);
        return;
    }
    values_.emplace(std::string{name}, std::move(value));
}

auto ValueTable::erase(std::string_view name) -> bool
{
    const auto found = values_.find(name);
    if (found == values_.end())
    {
        return false;
    }
    values_.erase(found);
    return true;
}

auto ValueTable::find(std::string_view name) const -> const UniformValue *
{
    const auto found = values_.find(name);
    return found == values_.end() ? nullptr : &found->second;
}

auto ValueTable::names() const -> std::vector<std::string>
{
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto &entry : values_)
    {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace ufg::sync
