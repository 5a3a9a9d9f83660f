/**
 * @file uniform_types.hpp
 * @brief closed GLSL uniform type table with std140 sizes (the one true lookup uwu)
 *
 * every uniform that can live inside a std140 block is one of a fixed set of
 * scalar, vector, matrix, or sampler types. this header turns that set into a
 * strongly typed enum plus a constexpr trait table so the planner and the
 * sync-procedure builder never string-compare type names on the hot path.
 *
 * the size column is the std140 footprint used by the chunk planner: vec3
 * rounds up to 16 bytes, matrices are N columns of 16 bytes each. reflection
 * hands us GLSL spellings ("vec3", "mat4"), so parse_uniform_type is the only
 * place strings are accepted; anything outside the table is an UnknownType
 * error and never a silent fallback ✨
 *
 * @note requires C++23 (std::expected) and GCC 13+ / Clang 17+
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace ufg::layout
{

/**
 * @brief closed set of uniform types that may appear inside a uniform block
 *
 * enum values double as indices into kTypeTable, keep the order in sync.
 */
enum class UniformType : std::uint8_t
{
    Float = 0U,
    Vec2,
    Vec3,
    Vec4,
    Int,
    IVec2,
    IVec3,
    IVec4,
    Uint,
    UVec2,
    UVec3,
    UVec4,
    Bool,
    BVec2,
    BVec3,
    BVec4,
    Mat2,
    Mat3,
    Mat4,
    Sampler2D
};

/**
 * @brief storage kind of each 32-bit component written into the packed buffer
 */
enum class ComponentKind : std::uint8_t
{
    Float,
    Int,
    Uint,
    Bool
};

/**
 * @brief coarse shape class used to pick a copy rule
 */
enum class TypeShape : std::uint8_t
{
    Scalar,
    Vector,
    Matrix
};

/**
 * @brief static facts about one uniform type
 */
struct TypeTraits
{
    std::string_view glsl_name;   ///< spelling used by shader reflection
    std::uint32_t    std140_size; ///< bytes consumed inside a std140 block
    std::uint32_t    components;  ///< 32-bit components copied per value (mat3 = 9)
    ComponentKind    kind;        ///< how each component is encoded
    TypeShape        shape;       ///< scalar / vector / matrix
};

/**
 * @brief category of layout failures surfaced to callers
 */
enum class LayoutErrorCode : std::uint8_t
{
    UnsupportedFeature, ///< e.g. array-typed uniforms (not implemented)
    UnknownType         ///< type spelling missing from the closed table
};

/**
 * @brief layout/codegen error payload with breadcrumbs (message + context trail)
 */
struct LayoutError
{
    LayoutErrorCode          code;    ///< failure category
    std::string              message; ///< human-readable summary
    std::vector<std::string> context; ///< breadcrumb trail (uniform name, etc.)
};

/// number of entries in the closed type table
inline constexpr std::size_t kUniformTypeCount = 20U;

/// size of one std140 chunk in bytes
inline constexpr std::uint32_t kChunkBytes = 16U;

/**
 * @brief the closed type table, indexed by UniformType
 */
inline constexpr std::array<TypeTraits, kUniformTypeCount> kTypeTable{{
    {"float", 4U, 1U, ComponentKind::Float, TypeShape::Scalar},
    {"vec2", 8U, 2U, ComponentKind::Float, TypeShape::Vector},
    {"vec3", 16U, 3U, ComponentKind::Float, TypeShape::Vector},
    {"vec4", 16U, 4U, ComponentKind::Float, TypeShape::Vector},
    {"int", 4U, 1U, ComponentKind::Int, TypeShape::Scalar},
    {"ivec2", 8U, 2U, ComponentKind::Int, TypeShape::Vector},
    {"ivec3", 16U, 3U, ComponentKind::Int, TypeShape::Vector},
    {"ivec4", 16U, 4U, ComponentKind::Int, TypeShape::Vector},
    {"uint", 4U, 1U, ComponentKind::Uint, TypeShape::Scalar},
    {"uvec2", 8U, 2U, ComponentKind::Uint, TypeShape::Vector},
    {"uvec3", 16U, 3U, ComponentKind::Uint, TypeShape::Vector},
    {"uvec4", 16U, 4U, ComponentKind::Uint, TypeShape::Vector},
    {"bool", 4U, 1U, ComponentKind::Bool, TypeShape::Scalar},
    {"bvec2", 8U, 2U, ComponentKind::Bool, TypeShape::Vector},
    {"bvec3", 16U, 3U, ComponentKind::Bool, TypeShape::Vector},
    {"bvec4", 16U, 4U, ComponentKind::Bool, TypeShape::Vector},
    {"mat2", 32U, 4U, ComponentKind::Float, TypeShape::Matrix},
    {"mat3", 48U, 9U, ComponentKind::Float, TypeShape::Matrix},
    {"mat4", 64U, 16U, ComponentKind::Float, TypeShape::Matrix},
    {"sampler2D", 4U, 1U, ComponentKind::Int, TypeShape::Scalar},
}};

/**
 * @brief fetch the trait row for a type
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] type uniform type from the closed enum
 * @return reference into kTypeTable
 * @throws std::logic_error when @p type is outside the closed set (corrupted enum)
 */
[[nodiscard]] auto traits(UniformType type) -> const TypeTraits &;

/**
 * @brief std140 byte size of a type (float=4, vec2=8, vec3/vec4=16, mat4=64, ...)
 */
[[nodiscard]] auto std140_size(UniformType type) -> std::uint32_t;

/**
 * @brief GLSL spelling of a type ("vec3", "sampler2D", ...)
 */
[[nodiscard]] auto to_string(UniformType type) -> std::string_view;

/**
 * @brief map a reflection spelling onto the closed enum
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] glsl_name exact GLSL type spelling (case-sensitive)
 * @return matching UniformType or LayoutError{UnknownType}
 */
[[nodiscard]] auto parse_uniform_type(std::string_view glsl_name) -> std::expected<UniformType, LayoutError>;

} // namespace ufg::layout
