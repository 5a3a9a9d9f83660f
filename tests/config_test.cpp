/**
 * @file config_test.cpp
 * @brief YAML block loader validation + bridges into the sync layer uwu
 */
#include <cstdint>
#include <filesystem>
#include <functional>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "support/block_builder.hpp"
#include "ufg/config/config.hpp"
#include "test_config.hpp"

using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;
using ufg::layout::UniformType;

namespace
{

[[nodiscard]] auto test_data_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{UFG_TEST_DATA_DIR} / file;
}

[[nodiscard]] auto make_good_config() -> ufg::config::Config
{
    const auto result = ufg::config::load_config_from_string(ufg::test_support::make_blocks_yaml());
    if (!result)
    {
        throw std::runtime_error("expected default builder to succeed");
    }
    return result.value();
}

} // namespace

TEST(ConfigLoader, ParsesGoldenBlockFromBuilder)
{
    const auto config = make_good_config();
    ASSERT_EQ(config.blocks.size(), 1U);
    const auto &block = config.blocks.front();
    EXPECT_EQ(block.name, "lighting");
    ASSERT_EQ(block.uniforms.size(), 2U);

    EXPECT_EQ(block.uniforms[0].name, "uTint");
    EXPECT_EQ(block.uniforms[0].type, UniformType::Float);
    EXPECT_EQ(block.uniforms[0].size, 1U);
    EXPECT_EQ(block.uniforms[0].index, 0U);
    ASSERT_TRUE(block.uniforms[0].value.has_value());
    EXPECT_FLOAT_EQ(std::get<float>(*block.uniforms[0].value), 0.5F);

    EXPECT_EQ(block.uniforms[1].type, UniformType::Vec3);
    EXPECT_EQ(block.uniforms[1].index, 1U);
    ASSERT_TRUE(block.uniforms[1].value.has_value());
    EXPECT_THAT(std::get<std::vector<float>>(*block.uniforms[1].value), ElementsAre(0.0F, 1.0F, 0.0F));
}

TEST(ConfigLoader, ExplicitIndexAndBoolComponents)
{
    ufg::test_support::BlockBuilderOptions options;
    options.blocks.front().uniforms = {
        {"uMask", "bvec2", std::nullopt, "7", "[true, false]"},
        {"uLevel", "ivec2", std::nullopt, "3", "[-2, 5]"},
    };
    const auto parsed = ufg::config::load_config_from_string(ufg::test_support::make_blocks_yaml(options));
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

    const auto &uniforms = parsed->blocks.front().uniforms;
    EXPECT_EQ(uniforms[0].index, 7U);
    EXPECT_THAT(std::get<std::vector<std::uint32_t>>(*uniforms[0].value), ElementsAre(1U, 0U));
    EXPECT_THAT(std::get<std::vector<std::int32_t>>(*uniforms[1].value), ElementsAre(-2, 5));
}

TEST(ConfigLoader, LoadsSceneFixtureOnDisk)
{
    const auto result = ufg::config::load_config_from_file(test_data_path("scene_blocks.yaml"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->blocks.size(), 2U);

    const auto *camera = ufg::config::find_block(*result, "camera");
    ASSERT_NE(camera, nullptr);
    EXPECT_EQ(camera->uniforms.front().type, UniformType::Mat4);
    EXPECT_EQ(std::get<std::vector<float>>(*camera->uniforms.front().value).size(), 16U);

    const auto *material = ufg::config::find_block(*result, "material");
    ASSERT_NE(material, nullptr);
    EXPECT_EQ(std::get<std::int32_t>(*material->uniforms[4].value), 2);
    EXPECT_TRUE(std::get<bool>(*material->uniforms[3].value));
    EXPECT_FALSE(material->uniforms[5].value.has_value());

    EXPECT_EQ(ufg::config::find_block(*result, "shadow"), nullptr);
}

TEST(ConfigLoader, BridgesSkipUniformsWithoutValues)
{
    const auto result = ufg::config::load_config_from_file(test_data_path("scene_blocks.yaml"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto *material = ufg::config::find_block(*result, "material");
    ASSERT_NE(material, nullptr);

    const auto program = ufg::config::make_program_uniforms(*material);
    EXPECT_EQ(program.size(), 6U);
    EXPECT_EQ(program.at("uDetailScale").type, UniformType::Vec2);
    EXPECT_EQ(program.at("uFlags").index, 2U);

    const auto values = ufg::config::make_value_table(*material);
    EXPECT_EQ(values.size(), 5U);
    EXPECT_FALSE(values.contains("uDetailScale"));
    EXPECT_TRUE(values.contains("uAlbedoMap"));
}

TEST(ConfigLoader, MissingFileIsReported)
{
    const auto result = ufg::config::load_config_from_file(test_data_path("does_not_exist.yaml"));
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("unable to open config file"));
}

TEST(ConfigLoader, MalformedYamlIsReported)
{
    const auto result = ufg::config::load_config_from_string("blocks: [\n  - name: x");
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("YAML parse error"));
}

struct InvalidConfigCase
{
    std::string                                name;
    ufg::test_support::BlockBuilderOptions     options;
    std::string                                expected_message_substring;
    std::vector<std::string>                   expected_context;
    std::function<void(std::string &)>         mutate_yaml; ///< optional for bespoke tweaks
};

class ConfigInvalidTest : public ::testing::TestWithParam<InvalidConfigCase>
{};

TEST_P(ConfigInvalidTest, ReportsDetailedValidationErrors)
{
    auto yaml = ufg::test_support::make_blocks_yaml(GetParam().options);
    if (GetParam().mutate_yaml)
    {
        GetParam().mutate_yaml(yaml);
    }
    const auto result = ufg::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value()) << "expected failure for case: " << GetParam().name;
    EXPECT_THAT(result.error().message, HasSubstr(GetParam().expected_message_substring));
    if (!GetParam().expected_context.empty())
    {
        EXPECT_THAT(result.error().context, ElementsAreArray(GetParam().expected_context));
    }
}

auto make_invalid_cases() -> std::vector<InvalidConfigCase>
{
    using ufg::test_support::BlockBuilderOptions;
    using ufg::test_support::BlockEntrySpec;
    using ufg::test_support::UniformEntrySpec;

    std::vector<InvalidConfigCase> cases;

    {
        BlockBuilderOptions opts{};
        opts.include_blocks = false;
        cases.push_back({"MissingBlocks", opts, "blocks must be a non-empty sequence", {"blocks"}, nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.clear();
        cases.push_back({"EmptyBlocks", opts, "blocks must be a non-empty sequence", {"blocks"}, nullptr});
    }

    {
        BlockBuilderOptions opts{};
        cases.push_back({"RootIsSequence", opts, "config root must be a mapping", {}, [](std::string &yaml) {
                             yaml = "- 1\n- 2\n";
                         }});
    }

    {
        BlockBuilderOptions opts{};
        cases.push_back({"BlockIsScalar", opts, "block entry must be a map", {"blocks", "[0]"},
                         [](std::string &yaml) { yaml = "blocks:\n  - 3\n"; }});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks = {BlockEntrySpec{}, BlockEntrySpec{}};
        cases.push_back(
            {"DuplicateBlockNames", opts, "block names must be unique", {"blocks", "[1]", "name"}, nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().include_uniforms = false;
        cases.push_back({"MissingUniforms",
                         opts,
                         "block uniforms must be a sequence",
                         {"blocks", "[0]", "uniforms"},
                         nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().uniforms = {UniformEntrySpec{"uTint", "vec5"}};
        cases.push_back({"UnknownUniformType",
                         opts,
                         "unknown uniform type 'vec5'",
                         {"blocks", "[0]", "uniforms", "[0]", "type"},
                         nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().uniforms = {UniformEntrySpec{"''"}};
        cases.push_back({"EmptyUniformName",
                         opts,
                         "uniform name must not be empty",
                         {"blocks", "[0]", "uniforms", "[0]", "name"},
                         nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().uniforms = {UniformEntrySpec{"uTint", "float", "0"}};
        cases.push_back({"ZeroArraySize",
                         opts,
                         "uniform size must be >= 1",
                         {"blocks", "[0]", "uniforms", "[0]", "size"},
                         nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().uniforms = {UniformEntrySpec{"uTint", "float", std::nullopt, std::nullopt, "[1.0, 2.0]"}};
        cases.push_back({"SequenceForScalar",
                         opts,
                         "value must be a scalar",
                         {"blocks", "[0]", "uniforms", "[0]", "value"},
                         nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().uniforms = {UniformEntrySpec{"uDir", "vec3", std::nullopt, std::nullopt, "[1.0, 2.0]"}};
        cases.push_back({"ShortVectorValue",
                         opts,
                         "value must be a sequence of 3 components",
                         {"blocks", "[0]", "uniforms", "[0]", "value"},
                         nullptr});
    }

    {
        BlockBuilderOptions opts{};
        opts.blocks.front().uniforms = {UniformEntrySpec{}, UniformEntrySpec{}};
        cases.push_back({"DuplicateUniformNames",
                         opts,
                         "uniform names must be unique within a block",
                         {"blocks", "[0]", "uniforms", "[1]", "name"},
                         nullptr});
    }

    return cases;
}

INSTANTIATE_TEST_SUITE_P(ExhaustiveInvalidConfigs, ConfigInvalidTest,
                         ::testing::ValuesIn(make_invalid_cases()),
                         [](const ::testing::TestParamInfo<InvalidConfigCase> &test_info) {
                             return test_info.param.name;
                         });
