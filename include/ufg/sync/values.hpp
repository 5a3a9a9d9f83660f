/**
 * @file values.hpp
 * @brief current-value table feeding the sync procedures (name -> value)
 *
 * the value table is the thing game/app code mutates every frame: "uTime is
 * now 3.2", "uModel is this mat4". sync procedures read it by name and encode
 * each component into a 32-bit slot of the packed buffer. float components
 * stay IEEE floats, int/uint/bool components are stored bit-exact so the
 * shader sees the integer it expects.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ufg/layout/uniform_types.hpp"

namespace ufg::sync
{

/**
 * @brief value held for one uniform (scalars inline, vectors/matrices as flat components)
 *
 * matrices are flat in their own element order, no transposition happens on copy.
 * bvecN values travel as 0/1 integer components.
 */
using UniformValue = std::variant<float, std::int32_t, std::uint32_t, bool, std::vector<float>,
                                  std::vector<std::int32_t>, std::vector<std::uint32_t>>;

/**
 * @brief number of components carried by a value (1 for scalars)
 */
[[nodiscard]] auto component_count(const UniformValue &value) noexcept -> std::size_t;

/**
 * @brief false when a float component cannot be represented in an int/uint slot
 *
 * ✨ PURE FUNCTION ✨
 *
 * out-of-range magnitudes, negatives headed for uint, and NaN do not fit.
 * non-float components always fit (integer conversions wrap modulo 2^32).
 *
 * @pre index < component_count(value)
 */
[[nodiscard]] auto component_fits(const UniformValue &value, std::size_t index, layout::ComponentKind kind) -> bool;

/**
 * @brief encode component @p index of @p value into a 32-bit packed-buffer slot
 *
 * ✨ PURE FUNCTION ✨
 *
 * numeric conversion happens towards @p kind (an int value feeding a float
 * uniform becomes a float), then int/uint/bool results are bit-cast into the
 * float slot unchanged. floats headed for int/uint saturate at the type's
 * limits and NaN encodes as 0; callers that need to refuse such values check
 * component_fits() first.
 *
 * @pre index < component_count(value)
 */
[[nodiscard]] auto encode_component(const UniformValue &value, std::size_t index, layout::ComponentKind kind)
    -> float;

/**
 * @brief name-keyed table of current uniform values
 */
class ValueTable
{
public:
    ValueTable() = default;

    /**
     * @brief insert or overwrite a value
     */
    void set(std::string_view name, UniformValue value);

    /**
     * @brief remove a value, returns whether anything was erased
     */
    auto erase(std::string_view name) -> bool;

    /**
     * @brief lookup without allocating (heterogeneous string_view key)
     *
     * @return pointer into the table or nullptr when absent
     */
    [[nodiscard]] auto find(std::string_view name) const -> const UniformValue *;

    [[nodiscard]] auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    /**
     * @brief names sorted lexicographically (deterministic iteration for tools/tests)
     */
    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    struct TransparentHash
    {
        using is_transparent = void;

        [[nodiscard]] auto operator()(std::string_view value) const noexcept -> std::size_t
        {
            return std::hash<std::string_view>{}(value);
        }

        [[nodiscard]] auto operator()(const std::string &value) const noexcept -> std::size_t
        {
            return std::hash<std::string_view>{}(value);
        }
    };

    std::unordered_map<std::string, UniformValue, TransparentHash, std::equal_to<>> values_;
};

} // namespace ufg::sync
