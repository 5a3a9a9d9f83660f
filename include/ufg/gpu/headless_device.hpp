/**
 * @file headless_device.hpp
 * @brief minimal Vulkan instance + device + VMA allocator for offscreen uniform uploads
 *
 * no surface, no swapchain, no validation layers. picks the first physical
 * device that exposes any queue family and creates one queue on it. enough to
 * back a VmaUniformUploader from a command-line tool.
 *
 * @note built only with -DUFG_BUILD_VULKAN=ON (links Vulkan + VMA)
 */
#pragma once

#include <expected>
#include <string>

#include <vulkan/vulkan.h>
#include <vk_mem_alloc.h>

#include "ufg/gpu/uniform_buffer.hpp"

namespace ufg::gpu
{

/**
 * @brief RAII owner of VkInstance, VkDevice and VmaAllocator (destroyed in reverse order)
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (creates driver objects)
 */
class HeadlessDevice
{
public:
    HeadlessDevice() = default;

    /**
     * @brief create instance, device and allocator
     *
     * @return live device or UploadError whose context names the failing call and VkResult
     */
    static auto create() -> std::expected<HeadlessDevice, UploadError>;

    HeadlessDevice(const HeadlessDevice &)                     = delete;
    auto operator=(const HeadlessDevice &) -> HeadlessDevice & = delete;

    HeadlessDevice(HeadlessDevice &&other) noexcept;
    auto operator=(HeadlessDevice &&other) noexcept -> HeadlessDevice &;

    ~HeadlessDevice();

    [[nodiscard]] auto allocator() const noexcept -> VmaAllocator { return allocator_; }
    [[nodiscard]] auto device_name() const -> const std::string & { return device_name_; }

private:
    VkInstance       instance_{VK_NULL_HANDLE};
    VkPhysicalDevice physical_{VK_NULL_HANDLE};
    VkDevice         device_{VK_NULL_HANDLE};
    VmaAllocator     allocator_{nullptr};
    std::string      device_name_;

    void destroy() noexcept;
};

} // namespace ufg::gpu
