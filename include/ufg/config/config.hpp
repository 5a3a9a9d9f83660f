/**
 * @file config.hpp
 * @brief YAML uniform-block descriptions for tools and tests (schema + loader) uwu
 *
 * shader reflection is not always around (offline tooling, unit tests, golden
 * layout dumps), so blocks can be described in YAML instead: a list of blocks,
 * each with uniforms carrying a GLSL type, an optional array size, an optional
 * update index, and an optional current value. the loader validates hard
 * (unique names, known types, value shapes) and reports failures through
 * std::expected with breadcrumb context like {"blocks", "[0]", "uniforms",
 * "[2]", "type"}.
 *
 * example document:
 * @code
 * blocks:
 *   - name: lighting
 *     uniforms:
 *       - name: uTint
 *         type: float
 *         value: 0.5
 *       - name: uLightDir
 *         type: vec3
 *         value: [0.0, 1.0, 0.0]
 * @endcode
 *
 * @note yaml-cpp 0.7+ powers parsing; exceptions never escape the loader
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ufg/layout/uniform_types.hpp"
#include "ufg/sync/block_sync.hpp"
#include "ufg/sync/values.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace ufg::config
{

/**
 * @brief config error payload with context breadcrumbs
 */
struct ConfigError
{
    std::string              message; ///< human-readable error message
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief one uniform as declared in YAML
 */
struct UniformSpec
{
    std::string                       name;
    layout::UniformType               type;
    std::uint32_t                     size{1U};  ///< array size, > 1 is accepted here and rejected at planning
    std::uint32_t                     index{0U}; ///< defaults to the declaration position
    std::optional<sync::UniformValue> value;     ///< absent => uniform is skipped during sync
};

/**
 * @brief one named uniform block
 */
struct BlockSpec
{
    std::string              name;
    std::vector<UniformSpec> uniforms;
};

/**
 * @brief top-level config (ordered list of blocks)
 */
struct Config
{
    std::vector<BlockSpec> blocks;
};

using ConfigResult = std::expected<Config, ConfigError>;

/**
 * @brief parse a YAML file with full validation
 *
 * ⚠️ IMPURE FUNCTION (reads the filesystem)
 *
 * @param[in] path YAML document location
 * @return Config or ConfigError ("unable to open config file" when unreadable)
 */
[[nodiscard]] auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult;

/**
 * @brief parse YAML text (test-friendly), same validation as the file loader
 */
[[nodiscard]] auto load_config_from_string(std::string_view yaml_text) -> ConfigResult;

/**
 * @brief validate an already-loaded YAML root node
 */
[[nodiscard]] auto parse_config_node(const YAML::Node &root) -> ConfigResult;

/**
 * @brief find a block by name
 *
 * @return pointer into @p config or nullptr
 */
[[nodiscard]] auto find_block(const Config &config, std::string_view name) -> const BlockSpec *;

/**
 * @brief reflection view of a block (every declared uniform, valued or not)
 */
[[nodiscard]] auto make_program_uniforms(const BlockSpec &block) -> sync::ProgramUniforms;

/**
 * @brief current values of a block (only uniforms that declare a value)
 */
[[nodiscard]] auto make_value_table(const BlockSpec &block) -> sync::ValueTable;

} // namespace ufg::config
