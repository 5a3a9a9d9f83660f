/**
 * @file config.cpp
 * @brief YAML block description loader with breadcrumb validation
 *
 * leans on yaml-cpp, wraps everything in std::expected, and maps every
 * yaml-cpp exception into a ConfigError so callers never see a throw.
 */
#include "ufg/config/config.hpp"

#include <format>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace ufg::config
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> ConfigResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

template <typename T>
[[nodiscard]] auto read_components(const YAML::Node &node, std::size_t expected, const std::vector<std::string> &ctx)
    -> std::expected<std::vector<T>, ConfigError>
{
    if (!node.IsSequence() || node.size() != expected)
    {
        return std::unexpected(ConfigError{std::format("value must be a sequence of {} components", expected), ctx});
    }
    std::vector<T> components;
    components.reserve(expected);
    for (std::size_t i = 0; i < expected; ++i)
    {
        try
        {
            if constexpr (std::is_same_v<T, std::uint32_t>)
            {
                // bvec components arrive as true/false
                components.push_back(node[i].IsScalar() && (node[i].Scalar() == "true" || node[i].Scalar() == "false")
                                         ? static_cast<std::uint32_t>(node[i].as<bool>())
                                         : node[i].as<std::uint32_t>());
            }
            else
            {
                components.push_back(node[i].as<T>());
            }
        }
        catch (const YAML::Exception &ex)
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(std::format("[{}]", i));
            return std::unexpected(ConfigError{ex.what(), std::move(child_ctx)});
        }
    }
    return components;
}

template <typename T>
[[nodiscard]] auto read_vector_value(const YAML::Node &node, std::size_t expected, const std::vector<std::string> &ctx)
    -> std::expected<sync::UniformValue, ConfigError>
{
    auto components = read_components<T>(node, expected, ctx);
    if (!components)
    {
        return std::unexpected(std::move(components.error()));
    }
    return sync::UniformValue{std::move(*components)};
}

[[nodiscard]] auto parse_value(const YAML::Node &node, const layout::UniformType type, std::vector<std::string> ctx)
    -> std::expected<sync::UniformValue, ConfigError>
{
    const auto &traits = layout::traits(type);

    if (traits.components == 1U)
    {
        if (!node.IsScalar())
        {
            return std::unexpected(ConfigError{"value must be a scalar", std::move(ctx)});
        }
        try
        {
            switch (traits.kind)
            {
            case layout::ComponentKind::Float:
                return sync::UniformValue{node.as<float>()};
            case layout::ComponentKind::Int:
                return sync::UniformValue{node.as<std::int32_t>()};
            case layout::ComponentKind::Uint:
                return sync::UniformValue{node.as<std::uint32_t>()};
            case layout::ComponentKind::Bool:
                return sync::UniformValue{node.as<bool>()};
            }
        }
        catch (const YAML::Exception &ex)
        {
            return std::unexpected(ConfigError{ex.what(), std::move(ctx)});
        }
        return std::unexpected(ConfigError{"unsupported component kind", std::move(ctx)});
    }

    switch (traits.kind)
    {
    case layout::ComponentKind::Float:
        return read_vector_value<float>(node, traits.components, ctx);
    case layout::ComponentKind::Int:
        return read_vector_value<std::int32_t>(node, traits.components, ctx);
    case layout::ComponentKind::Uint:
    case layout::ComponentKind::Bool:
        return read_vector_value<std::uint32_t>(node, traits.components, ctx);
    }
    return std::unexpected(ConfigError{"unsupported component kind", std::move(ctx)});
}

[[nodiscard]] auto parse_uniform(const YAML::Node &node, const std::size_t position, std::vector<std::string> ctx)
    -> std::expected<UniformSpec, ConfigError>
{
    if (!node.IsMap())
    {
        return std::unexpected(ConfigError{"uniform entry must be a map", std::move(ctx)});
    }

    UniformSpec uniform{};
    std::string type_name;
    try
    {
        uniform.name = node["name"].as<std::string>();
        type_name    = node["type"].as<std::string>();
        uniform.size = node["size"].IsDefined() ? node["size"].as<std::uint32_t>() : 1U;
        uniform.index =
            node["index"].IsDefined() ? node["index"].as<std::uint32_t>() : static_cast<std::uint32_t>(position);
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(ConfigError{ex.what(), std::move(ctx)});
    }

    if (uniform.name.empty())
    {
        ctx.emplace_back("name");
        return std::unexpected(ConfigError{"uniform name must not be empty", std::move(ctx)});
    }

    const auto parsed_type = layout::parse_uniform_type(type_name);
    if (!parsed_type)
    {
        ctx.emplace_back("type");
        return std::unexpected(ConfigError{parsed_type.error().message, std::move(ctx)});
    }
    uniform.type = *parsed_type;

    if (uniform.size == 0U)
    {
        ctx.emplace_back("size");
        return std::unexpected(ConfigError{"uniform size must be >= 1", std::move(ctx)});
    }

    const auto value_node = node["value"];
    if (value_node.IsDefined() && !value_node.IsNull())
    {
        auto value_ctx = ctx;
        value_ctx.emplace_back("value");
        auto value = parse_value(value_node, uniform.type, std::move(value_ctx));
        if (!value)
        {
            return std::unexpected(std::move(value.error()));
        }
        uniform.value = std::move(*value);
    }

    return uniform;
}

} // namespace

auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_config_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(std::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_config_from_string(std::string_view yaml_text) -> ConfigResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_config_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_config_node(const YAML::Node &root) -> ConfigResult
{
    if (!root || !root.IsMap())
    {
        return make_error("config root must be a mapping", {});
    }

    const auto blocks_node = root["blocks"];
    if (!blocks_node || !blocks_node.IsSequence() || blocks_node.size() == 0U)
    {
        return make_error("blocks must be a non-empty sequence", {"blocks"});
    }

    Config cfg{};
    cfg.blocks.reserve(blocks_node.size());
    std::unordered_set<std::string> block_names;

    for (std::size_t b = 0; b < blocks_node.size(); ++b)
    {
        const auto block_node = blocks_node[b];
        const auto block_ctx  = std::vector<std::string>{"blocks", std::format("[{}]", b)};
        if (!block_node.IsMap())
        {
            return make_error("block entry must be a map", block_ctx);
        }

        BlockSpec block{};
        try
        {
            block.name = block_node["name"].as<std::string>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), block_ctx);
        }
        if (!block_names.insert(block.name).second)
        {
            auto ctx = block_ctx;
            ctx.emplace_back("name");
            return make_error("block names must be unique", std::move(ctx));
        }

        const auto uniforms_node = block_node["uniforms"];
        if (!uniforms_node || !uniforms_node.IsSequence())
        {
            auto ctx = block_ctx;
            ctx.emplace_back("uniforms");
            return make_error("block uniforms must be a sequence", std::move(ctx));
        }

        std::unordered_set<std::string> uniform_names;
        block.uniforms.reserve(uniforms_node.size());
        for (std::size_t u = 0; u < uniforms_node.size(); ++u)
        {
            auto ctx = block_ctx;
            ctx.emplace_back("uniforms");
            ctx.emplace_back(std::format("[{}]", u));

            auto uniform = parse_uniform(uniforms_node[u], u, ctx);
            if (!uniform)
            {
                return std::unexpected(std::move(uniform.error()));
            }
            if (!uniform_names.insert(uniform->name).second)
            {
                ctx.emplace_back("name");
                return make_error("uniform names must be unique within a block", std::move(ctx));
            }
            block.uniforms.push_back(std::move(*uniform));
        }

        cfg.blocks.push_back(std::move(block));
    }

    return cfg;
}

auto find_block(const Config &config, std::string_view name) -> const BlockSpec *
{
    for (const auto &block : config.blocks)
    {
        if (block.name == name)
        {
            return &block;
        }
    }
    return nullptr;
}

auto make_program_uniforms(const BlockSpec &block) -> sync::ProgramUniforms
{
    sync::ProgramUniforms program;
    program.reserve(block.uniforms.size());
    for (const auto &uniform : block.uniforms)
    {
        program.emplace(uniform.name, sync::UniformData{uniform.name, uniform.type, uniform.size, uniform.index});
    }
    return program;
}

auto make_value_table(const BlockSpec &block) -> sync::ValueTable
{
    sync::ValueTable values;
    for (const auto &uniform : block.uniforms)
    {
        if (uniform.value.has_value())
        {
            values.set(uniform.name, *uniform.value);
        }
    }
    return values;
}

} // namespace ufg::config
