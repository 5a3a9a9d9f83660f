/**
 * @file ufg_inspect.cpp
 * @brief CLI that plans YAML-described uniform blocks and dumps layout + packed words
 *
 * usage: ufg_inspect [--vulkan] <config.yaml> [block-name]
 *
 * --vulkan uploads through a VMA uniform buffer on a headless device instead of
 * the host mirror (needs a build with -DUFG_BUILD_VULKAN=ON)
 */

#include <bit>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ufg/common/log.hpp"
#include "ufg/config/config.hpp"
#include "ufg/gpu/uniform_buffer.hpp"
#include "ufg/layout/planner.hpp"
#include "ufg/sync/block_sync.hpp"

#if defined(UFG_ENABLE_VULKAN)
#include "ufg/gpu/headless_device.hpp"
#include "ufg/gpu/vma_uniform_uploader.hpp"
#endif

namespace
{

[[nodiscard]] auto join_context(const std::vector<std::string> &context) -> std::string
{
    std::string joined;
    for (const auto &crumb : context)
    {
        if (!joined.empty())
        {
            joined += " > ";
        }
        joined += crumb;
    }
    return joined;
}

void print_layout(const ufg::sync::GeneratedSync &generated)
{
    std::print("  {:<24} {:<10} {:>8} {:>6} {:>6}\n", "uniform", "type", "offset", "data", "chunk");
    for (const auto &entry : generated.layout.entries)
    {
        std::print("  {:<24} {:<10} {:>8} {:>6} {:>6}\n", entry.field.name, ufg::layout::to_string(entry.field.type),
                   entry.offset_bytes, entry.data_length_bytes, entry.chunk_length_bytes);
    }
    std::print("  total {} bytes, padding {} bytes\n", generated.layout.total_size_bytes,
               ufg::layout::padding_bytes(generated.layout));
}

void print_words(std::span<const float> words)
{
    for (std::size_t i = 0; i < words.size(); ++i)
    {
        if (i % 4U == 0U)
        {
            std::print("  [{:>4}]", i * 4U);
        }
        std::print(" 0x{:08x}", std::bit_cast<std::uint32_t>(words[i]));
        if (i % 4U == 3U)
        {
            std::print("\n");
        }
    }
}

[[nodiscard]] auto inspect_block(ufg::sync::SyncCache &cache, const ufg::config::BlockSpec &block,
                                 ufg::gpu::BufferUploader &uploader) -> bool
{
    ufg::sync::UniformBufferGroup group{};
    group.uniforms     = ufg::config::make_value_table(block);
    const auto program = ufg::config::make_program_uniforms(block);

    const auto generated = cache.get_or_build(group, program);
    if (!generated)
    {
        ufg::common::log_error("inspect", "block '{}': {} ({})", block.name, generated.error().message,
                               join_context(generated.error().context));
        return false;
    }

    if (auto synced = ufg::sync::sync_group(cache, group, program, uploader); !synced)
    {
        ufg::common::log_error("inspect", "block '{}': {} ({})", block.name, synced.error().message,
                               join_context(synced.error().context));
        return false;
    }

    std::print("block '{}' ({} of {} uniforms synced)\n", block.name, (*generated)->fields.size(),
               block.uniforms.size());
    print_layout(**generated);
    print_words(group.buffer.data());
    return true;
}

[[nodiscard]] auto inspect_blocks(const ufg::config::Config &config, const char *block_name,
                                  ufg::gpu::BufferUploader &uploader) -> int
{
    ufg::sync::SyncCache cache{};

    if (block_name != nullptr)
    {
        const auto *block = ufg::config::find_block(config, block_name);
        if (block == nullptr)
        {
            ufg::common::log_error("inspect", "no block named '{}'", block_name);
            return EXIT_FAILURE;
        }
        return inspect_block(cache, *block, uploader) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    bool ok = true;
    for (const auto &block : config.blocks)
    {
        ok = inspect_block(cache, block, uploader) && ok;
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

#if defined(UFG_ENABLE_VULKAN)
[[nodiscard]] auto inspect_on_device(const ufg::config::Config &config, const char *block_name) -> int
{
    auto device = ufg::gpu::HeadlessDevice::create();
    if (!device)
    {
        ufg::common::log_error("inspect", "vulkan error: {} ({})", device.error().message,
                               join_context(device.error().context));
        return EXIT_FAILURE;
    }

    auto uploader = ufg::gpu::VmaUniformUploader::create(device->allocator(), 256U);
    if (!uploader)
    {
        ufg::common::log_error("inspect", "vulkan error: {} ({})", uploader.error().message,
                               join_context(uploader.error().context));
        return EXIT_FAILURE;
    }

    const int status = inspect_blocks(config, block_name, *uploader);
    ufg::common::log_line("inspect", "uploaded to '{}' (capacity {} bytes, last update {})", device->device_name(),
                          static_cast<std::uint64_t>(uploader->capacity()), uploader->last_update_id());
    return status;
}
#endif

} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    bool                          use_vulkan = false;
    if (!args.empty() && args.front() == "--vulkan")
    {
        use_vulkan = true;
        args.erase(args.begin());
    }

    if (args.empty())
    {
        ufg::common::log_error("inspect", "usage: ufg_inspect [--vulkan] <config.yaml> [block-name]");
        return EXIT_FAILURE;
    }

    const auto config = ufg::config::load_config_from_file(std::string{args[0]});
    if (!config)
    {
        ufg::common::log_error("inspect", "config error: {} ({})", config.error().message,
                               join_context(config.error().context));
        return EXIT_FAILURE;
    }

    const char *block_name = args.size() >= 2U ? args[1].data() : nullptr;

    if (use_vulkan)
    {
#if defined(UFG_ENABLE_VULKAN)
        return inspect_on_device(*config, block_name);
#else
        ufg::common::log_error("inspect", "ufg_inspect was built without Vulkan support (-DUFG_BUILD_VULKAN=ON)");
        return EXIT_FAILURE;
#endif
    }

    ufg::gpu::HostMirrorUploader uploader{};
    return inspect_blocks(*config, block_name, uploader);
}
