/**
 * @file uniform_types_test.cpp
 * @brief closed type table checks: std140 sizes, spellings, component facts
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ufg/layout/uniform_types.hpp"

using ufg::layout::ComponentKind;
using ufg::layout::LayoutErrorCode;
using ufg::layout::TypeShape;
using ufg::layout::UniformType;

/**
 * @test every row of the std140 size table matches the GLSL rules
 */
TEST(UniformTypes, Std140SizesFollowTheClosedTable)
{
    const std::vector<std::pair<UniformType, std::uint32_t>> expected{
        {UniformType::Float, 4U},  {UniformType::Vec2, 8U},   {UniformType::Vec3, 16U},  {UniformType::Vec4, 16U},
        {UniformType::Int, 4U},    {UniformType::IVec2, 8U},  {UniformType::IVec3, 16U}, {UniformType::IVec4, 16U},
        {UniformType::Uint, 4U},   {UniformType::UVec2, 8U},  {UniformType::UVec3, 16U}, {UniformType::UVec4, 16U},
        {UniformType::Bool, 4U},   {UniformType::BVec2, 8U},  {UniformType::BVec3, 16U}, {UniformType::BVec4, 16U},
        {UniformType::Mat2, 32U},  {UniformType::Mat3, 48U},  {UniformType::Mat4, 64U},  {UniformType::Sampler2D, 4U},
    };
    ASSERT_EQ(expected.size(), ufg::layout::kUniformTypeCount);
    for (const auto &[type, size] : expected)
    {
        EXPECT_EQ(ufg::layout::std140_size(type), size) << ufg::layout::to_string(type);
    }
}

/**
 * @test every GLSL spelling parses back to the enum it came from
 */
TEST(UniformTypes, SpellingsRoundTripThroughParser)
{
    for (std::size_t i = 0; i < ufg::layout::kUniformTypeCount; ++i)
    {
        const auto type   = static_cast<UniformType>(i);
        const auto parsed = ufg::layout::parse_uniform_type(ufg::layout::to_string(type));
        ASSERT_TRUE(parsed.has_value()) << ufg::layout::to_string(type);
        EXPECT_EQ(*parsed, type);
    }
}

/**
 * @test unknown spellings (and wrong case) are UnknownType errors
 */
TEST(UniformTypes, UnknownSpellingIsRejected)
{
    for (const std::string name : {"vec5", "Vec3", "double", "sampler3D", ""})
    {
        const auto parsed = ufg::layout::parse_uniform_type(name);
        ASSERT_FALSE(parsed.has_value()) << name;
        EXPECT_EQ(parsed.error().code, LayoutErrorCode::UnknownType);
        EXPECT_THAT(parsed.error().message, testing::HasSubstr("unknown uniform type"));
    }
}

/**
 * @test component counts and kinds drive the copy rules
 */
TEST(UniformTypes, ComponentFactsMatchShape)
{
    EXPECT_EQ(ufg::layout::traits(UniformType::Vec3).components, 3U);
    EXPECT_EQ(ufg::layout::traits(UniformType::Vec3).shape, TypeShape::Vector);
    EXPECT_EQ(ufg::layout::traits(UniformType::Mat3).components, 9U);
    EXPECT_EQ(ufg::layout::traits(UniformType::Mat3).shape, TypeShape::Matrix);
    EXPECT_EQ(ufg::layout::traits(UniformType::Mat2).components, 4U);
    EXPECT_EQ(ufg::layout::traits(UniformType::IVec2).kind, ComponentKind::Int);
    EXPECT_EQ(ufg::layout::traits(UniformType::UVec4).kind, ComponentKind::Uint);
    EXPECT_EQ(ufg::layout::traits(UniformType::BVec3).kind, ComponentKind::Bool);
    EXPECT_EQ(ufg::layout::traits(UniformType::Sampler2D).shape, TypeShape::Scalar);
    EXPECT_EQ(ufg::layout::traits(UniformType::Sampler2D).kind, ComponentKind::Int);
}

/**
 * @test a corrupted enum value is a programming error, not a soft failure
 */
TEST(UniformTypes, CorruptedEnumThrows)
{
    const auto corrupted = static_cast<UniformType>(200U);
    EXPECT_THROW(static_cast<void>(ufg::layout::std140_size(corrupted)), std::logic_error);
}
