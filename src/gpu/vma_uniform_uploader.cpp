/**
 * @file vma_uniform_uploader.cpp
 * @brief VMA-backed uniform buffer uploads (persistently mapped, flushed per update)
 */

#define VMA_IMPLEMENTATION
#include "ufg/gpu/vma_uniform_uploader.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

#include "ufg/common/log.hpp"

namespace ufg::gpu
{
namespace
{

[[nodiscard]] auto make_error(std::string message, VkResult result, std::string stage) -> UploadError
{
    UploadError err{};
    err.message = std::move(message);
    err.context = {std::move(stage), "VkResult=" + std::to_string(static_cast<int>(result))};
    return err;
}

} // namespace

auto VmaUniformUploader::create(VmaAllocator allocator, const VkDeviceSize capacity_bytes)
    -> std::expected<VmaUniformUploader, UploadError>
{
    if (allocator == nullptr)
    {
        return std::unexpected(UploadError{"VMA allocator is null", {"vma_uniform_uploader"}});
    }

    VmaUniformUploader uploader{};
    uploader.allocator_ = allocator;
    if (auto allocated = uploader.allocate(std::max<VkDeviceSize>(capacity_bytes, 16U)); !allocated)
    {
        return std::unexpected(std::move(allocated.error()));
    }
    return uploader;
}

VmaUniformUploader::VmaUniformUploader(VmaUniformUploader &&other) noexcept
    : allocator_{std::exchange(other.allocator_, nullptr)},
      buffer_{std::exchange(other.buffer_, VK_NULL_HANDLE)},
      allocation_{std::exchange(other.allocation_, nullptr)},
      mapped_{std::exchange(other.mapped_, nullptr)},
      capacity_{std::exchange(other.capacity_, 0U)},
      uploaded_bytes_{std::exchange(other.uploaded_bytes_, 0U)},
      last_update_id_{std::exchange(other.last_update_id_, 0U)}
{
}

auto VmaUniformUploader::operator=(VmaUniformUploader &&other) noexcept -> VmaUniformUploader &
{
    if (this != &other)
    {
        destroy();
        allocator_      = std::exchange(other.allocator_, nullptr);
        buffer_         = std::exchange(other.buffer_, VK_NULL_HANDLE);
        allocation_     = std::exchange(other.allocation_, nullptr);
        mapped_         = std::exchange(other.mapped_, nullptr);
        capacity_       = std::exchange(other.capacity_, 0U);
        uploaded_bytes_ = std::exchange(other.uploaded_bytes_, 0U);
        last_update_id_ = std::exchange(other.last_update_id_, 0U);
    }
    return *this;
}

VmaUniformUploader::~VmaUniformUploader()
{
    destroy();
}

auto VmaUniformUploader::allocate(const VkDeviceSize capacity_bytes) -> std::expected<void, UploadError>
{
    VkBufferCreateInfo buffer_info{};
    buffer_info.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    buffer_info.size        = capacity_bytes;
    buffer_info.usage       = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo alloc_info{};
    alloc_info.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
    alloc_info.usage = VMA_MEMORY_USAGE_AUTO_PREFER_HOST;

    VkBuffer          buffer     = VK_NULL_HANDLE;
    VmaAllocation     allocation = nullptr;
    VmaAllocationInfo allocation_info{};
    const VkResult result =
        vmaCreateBuffer(allocator_, &buffer_info, &alloc_info, &buffer, &allocation, &allocation_info);
    if (result != VK_SUCCESS)
    {
        common::log_error("vma", "vmaCreateBuffer({} bytes) failed with VkResult {}",
                          static_cast<std::uint64_t>(capacity_bytes), static_cast<int>(result));
        return std::unexpected(make_error("vmaCreateBuffer for uniform block failed", result, "allocate"));
    }
    if (allocation_info.pMappedData == nullptr)
    {
        vmaDestroyBuffer(allocator_, buffer, allocation);
        return std::unexpected(UploadError{"uniform buffer allocation is not host mapped", {"allocate"}});
    }

    buffer_     = buffer;
    allocation_ = allocation;
    mapped_     = static_cast<std::byte *>(allocation_info.pMappedData);
    capacity_   = capacity_bytes;
    common::log_line("vma", "allocated uniform buffer ({} bytes)", static_cast<std::uint64_t>(capacity_bytes));
    return {};
}

auto VmaUniformUploader::update(UniformBuffer &buffer) -> std::expected<void, UploadError>
{
    if (allocator_ == nullptr)
    {
        return std::unexpected(UploadError{"uploader has no VMA allocator", {"update"}});
    }

    const auto bytes = buffer.bytes();
    if (bytes.size() > capacity_)
    {
        destroy();
        if (auto grown = allocate(static_cast<VkDeviceSize>(bytes.size())); !grown)
        {
            return std::unexpected(std::move(grown.error()));
        }
    }

    if (!bytes.empty())
    {
        std::memcpy(mapped_, bytes.data(), bytes.size());
        const VkResult result = vmaFlushAllocation(allocator_, allocation_, 0U, bytes.size());
        if (result != VK_SUCCESS)
        {
            common::log_error("vma", "vmaFlushAllocation failed with VkResult {}", static_cast<int>(result));
            return std::unexpected(make_error("vmaFlushAllocation failed", result, "update"));
        }
    }

    uploaded_bytes_ = bytes.size();
    last_update_id_ = buffer.update_id();
    return {};
}

auto VmaUniformUploader::descriptor_info() const noexcept -> VkDescriptorBufferInfo
{
    VkDescriptorBufferInfo info{};
    info.buffer = buffer_;
    info.offset = 0U;
    info.range  = uploaded_bytes_ == 0U ? VK_WHOLE_SIZE : uploaded_bytes_;
    return info;
}

void VmaUniformUploader::destroy() noexcept
{
    if (buffer_ != VK_NULL_HANDLE && allocator_ != nullptr)
    {
        vmaDestroyBuffer(allocator_, buffer_, allocation_);
    }
    buffer_     = VK_NULL_HANDLE;
    allocation_ = nullptr;
    mapped_     = nullptr;
    capacity_   = 0U;
}

} // namespace ufg::gpu
