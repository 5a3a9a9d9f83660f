/**
 * @file headless_device.cpp
 * @brief offscreen Vulkan 1.3 device bring-up for the VMA uniform uploader
 */

#include "ufg/gpu/headless_device.hpp"

#include <cstdint>
#include <utility>
#include <vector>

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

[[nodiscard]] auto create_instance() -> std::expected<VkInstance, UploadError>
{
    VkApplicationInfo app_info{};
    app_info.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName   = "ufg_inspect";
    app_info.applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app_info.pEngineName        = "ufg";
    app_info.engineVersion      = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app_info.apiVersion         = VK_API_VERSION_1_3;

    VkInstanceCreateInfo create_info{};
    create_info.sType            = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo = &app_info;

    VkInstance     instance = VK_NULL_HANDLE;
    const VkResult result   = vkCreateInstance(&create_info, nullptr, &instance);
    if (result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateInstance failed", result, "vkCreateInstance"));
    }
    return instance;
}

[[nodiscard]] auto first_physical_device(VkInstance instance) -> std::expected<VkPhysicalDevice, UploadError>
{
    std::uint32_t count = 0U;
    vkEnumeratePhysicalDevices(instance, &count, nullptr);
    if (count == 0U)
    {
        return std::unexpected(UploadError{"vkEnumeratePhysicalDevices returned zero devices",
                                           {"vkEnumeratePhysicalDevices"}});
    }
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance, &count, devices.data());
    return devices.front();
}

[[nodiscard]] auto create_logical_device(VkPhysicalDevice physical) -> std::expected<VkDevice, UploadError>
{
    std::uint32_t family_count = 0U;
    vkGetPhysicalDeviceQueueFamilyProperties(physical, &family_count, nullptr);
    if (family_count == 0U)
    {
        return std::unexpected(UploadError{"physical device exposes no queue families", {"vkCreateDevice"}});
    }

    // uniform uploads never submit work, any family will do
    const float             queue_priority = 1.0F;
    VkDeviceQueueCreateInfo queue_info{};
    queue_info.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    queue_info.queueFamilyIndex = 0U;
    queue_info.queueCount       = 1U;
    queue_info.pQueuePriorities = &queue_priority;

    VkDeviceCreateInfo device_info{};
    device_info.sType                = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    device_info.queueCreateInfoCount = 1U;
    device_info.pQueueCreateInfos    = &queue_info;

    VkDevice       device = VK_NULL_HANDLE;
    const VkResult result = vkCreateDevice(physical, &device_info, nullptr, &device);
    if (result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateDevice failed", result, "vkCreateDevice"));
    }
    return device;
}

[[nodiscard]] auto create_allocator(VkInstance instance, VkPhysicalDevice physical, VkDevice device)
    -> std::expected<VmaAllocator, UploadError>
{
    VmaVulkanFunctions functions{};
    functions.vkGetInstanceProcAddr = &vkGetInstanceProcAddr;
    functions.vkGetDeviceProcAddr   = &vkGetDeviceProcAddr;

    VmaAllocatorCreateInfo create_info{};
    create_info.instance         = instance;
    create_info.physicalDevice   = physical;
    create_info.device           = device;
    create_info.vulkanApiVersion = VK_API_VERSION_1_3;
    create_info.pVulkanFunctions = &functions;

    VmaAllocator   allocator = nullptr;
    const VkResult result    = vmaCreateAllocator(&create_info, &allocator);
    if (result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vmaCreateAllocator failed", result, "vmaCreateAllocator"));
    }
    return allocator;
}

} // namespace

auto HeadlessDevice::create() -> std::expected<HeadlessDevice, UploadError>
{
    HeadlessDevice headless{};

    auto instance = create_instance();
    if (!instance)
    {
        return std::unexpected(std::move(instance.error()));
    }
    headless.instance_ = *instance;

    auto physical = first_physical_device(headless.instance_);
    if (!physical)
    {
        return std::unexpected(std::move(physical.error()));
    }
    headless.physical_ = *physical;

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(headless.physical_, &props);
    headless.device_name_ = props.deviceName;

    auto device = create_logical_device(headless.physical_);
    if (!device)
    {
        return std::unexpected(std::move(device.error()));
    }
    headless.device_ = *device;

    auto allocator = create_allocator(headless.instance_, headless.physical_, headless.device_);
    if (!allocator)
    {
        return std::unexpected(std::move(allocator.error()));
    }
    headless.allocator_ = *allocator;

    common::log_line("vma", "headless device ready on '{}'", headless.device_name_);
    return headless;
}

HeadlessDevice::HeadlessDevice(HeadlessDevice &&other) noexcept
    : instance_{std::exchange(other.instance_, VK_NULL_HANDLE)},
      physical_{std::exchange(other.physical_, VK_NULL_HANDLE)},
      device_{std::exchange(other.device_, VK_NULL_HANDLE)},
      allocator_{std::exchange(other.allocator_, nullptr)},
      device_name_{std::move(other.device_name_)}
{
}

auto HeadlessDevice::operator=(HeadlessDevice &&other) noexcept -> HeadlessDevice &
{
    if (this != &other)
    {
        destroy();
        instance_    = std::exchange(other.instance_, VK_NULL_HANDLE);
        physical_    = std::exchange(other.physical_, VK_NULL_HANDLE);
        device_      = std::exchange(other.device_, VK_NULL_HANDLE);
        allocator_   = std::exchange(other.allocator_, nullptr);
        device_name_ = std::move(other.device_name_);
    }
    return *this;
}

HeadlessDevice::~HeadlessDevice()
{
    destroy();
}

void HeadlessDevice::destroy() noexcept
{
    if (allocator_ != nullptr)
    {
        vmaDestroyAllocator(allocator_);
        allocator_ = nullptr;
    }
    if (device_ != VK_NULL_HANDLE)
    {
        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE)
    {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
    physical_ = VK_NULL_HANDLE;
}

} // namespace ufg::gpu
