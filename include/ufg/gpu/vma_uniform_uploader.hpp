/**
 * @file vma_uniform_uploader.hpp
 * @brief host-visible Vulkan uniform buffer fed by sync procedures (VMA-backed)
 *
 * owns one VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT buffer allocated through the
 * Vulkan Memory Allocator with a persistent mapping. update() memcpy's the
 * packed std140 bytes into the mapping and flushes, growing the allocation
 * when a block's layout got bigger. descriptor code grabs buffer() and
 * descriptor_info() to bind it.
 *
 * @note built only with -DUFG_BUILD_VULKAN=ON (links Vulkan + VMA)
 */
#pragma once

#include <cstdint>
#include <expected>

#include <vulkan/vulkan.h>
#include <vk_mem_alloc.h>

#include "ufg/gpu/uniform_buffer.hpp"

namespace ufg::gpu
{

/**
 * @brief RAII VMA uniform buffer implementing the BufferUploader seam
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (allocates device memory and writes through a mapping)
 */
class VmaUniformUploader final : public BufferUploader
{
public:
    VmaUniformUploader() = default;

    /**
     * @brief allocate the initial uniform buffer
     *
     * @param[in] allocator live VMA allocator (must outlive the uploader)
     * @param[in] capacity_bytes initial capacity, grown on demand by update()
     * @return uploader or UploadError carrying the VkResult in its context
     */
    static auto create(VmaAllocator allocator, VkDeviceSize capacity_bytes)
        -> std::expected<VmaUniformUploader, UploadError>;

    VmaUniformUploader(const VmaUniformUploader &)                     = delete;
    auto operator=(const VmaUniformUploader &) -> VmaUniformUploader & = delete;

    VmaUniformUploader(VmaUniformUploader &&other) noexcept;
    auto operator=(VmaUniformUploader &&other) noexcept -> VmaUniformUploader &;

    ~VmaUniformUploader() override;

    auto update(UniformBuffer &buffer) -> std::expected<void, UploadError> override;

    [[nodiscard]] auto buffer() const noexcept -> VkBuffer { return buffer_; }
    [[nodiscard]] auto capacity() const noexcept -> VkDeviceSize { return capacity_; }
    [[nodiscard]] auto last_update_id() const noexcept -> std::uint64_t { return last_update_id_; }

    /**
     * @brief descriptor write payload covering the last uploaded range
     */
    [[nodiscard]] auto descriptor_info() const noexcept -> VkDescriptorBufferInfo;

private:
    VmaAllocator  allocator_{nullptr};
    VkBuffer      buffer_{VK_NULL_HANDLE};
    VmaAllocation allocation_{nullptr};
    std::byte    *mapped_{nullptr};
    VkDeviceSize  capacity_{0U};
    VkDeviceSize  uploaded_bytes_{0U};
    std::uint64_t last_update_id_{0U};

    [[nodiscard]] auto allocate(VkDeviceSize capacity_bytes) -> std::expected<void, UploadError>;
    void destroy() noexcept;
};

} // namespace ufg::gpu
