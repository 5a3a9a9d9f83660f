/**
 * @file block_builder.hpp
 * @brief test-only YAML block generator so config suites stay DRY uwu
 *
 * test cases tweak the options struct to dial in weird edge cases (missing
 * sections, unknown types, short values) and feed the emitted string into
 * ufg::config::load_config_from_string so the real parser runs every time.
 */
#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ufg::test_support
{

struct UniformEntrySpec
{
    std::string                name{"uTint"};
    std::string                type{"float"};
    std::optional<std::string> size{};
    std::optional<std::string> index{};
    std::optional<std::string> value{"0.5"}; ///< raw YAML for the value node
};

struct BlockEntrySpec
{
    std::string                   name{"lighting"};
    bool                          include_uniforms{true};
    std::vector<UniformEntrySpec> uniforms{
        UniformEntrySpec{},
        UniformEntrySpec{"uLightDir", "vec3", std::nullopt, std::nullopt, "[0.0, 1.0, 0.0]"},
    };
};

struct BlockBuilderOptions
{
    bool                        include_blocks{true};
    std::vector<BlockEntrySpec> blocks{{}};
};

inline auto make_blocks_yaml(const BlockBuilderOptions &options = {}) -> std::string
{
    std::ostringstream oss;
    if (!options.include_blocks)
    {
        oss << "other: 1\n";
        return oss.str();
    }

    oss << "blocks:\n";
    if (options.blocks.empty())
    {
        oss << "  []\n";
        return oss.str();
    }
    for (const auto &block : options.blocks)
    {
        oss << "  - name: " << block.name << "\n";
        if (!block.include_uniforms)
        {
            continue;
        }
        oss << "    uniforms:\n";
        if (block.uniforms.empty())
        {
            oss << "      []\n";
        }
        for (const auto &uniform : block.uniforms)
        {
            oss << "      - name: " << uniform.name << "\n";
            oss << "        type: " << uniform.type << "\n";
            if (uniform.size)
            {
                oss << "        size: " << *uniform.size << "\n";
            }
            if (uniform.index)
            {
                oss << "        index: " << *uniform.index << "\n";
            }
            if (uniform.value)
            {
                oss << "        value: " << *uniform.value << "\n";
            }
        }
    }
    return oss.str();
}

} // namespace ufg::test_support
