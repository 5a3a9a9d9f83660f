/**
 * @file uniform_buffer.cpp
 * @brief packed block storage + host mirror uploader
 */

#include "ufg/gpu/uniform_buffer.hpp"

#include <algorithm>

namespace ufg::gpu
{

UniformBuffer::UniformBuffer(const std::size_t size_bytes)
{
    reset(size_bytes);
}

void UniformBuffer::reset(const std::size_t size_bytes)
{
    data_.assign(size_bytes / sizeof(float), 0.0F);
    mark_updated();
}

auto HostMirrorUploader::update(UniformBuffer &buffer) -> std::expected<void, UploadError>
{
    const auto bytes = buffer.bytes();
    mirror_.resize(bytes.size());
    std::copy(bytes.begin(), bytes.end(), mirror_.begin());
    last_update_id_ = buffer.update_id();
    ++upload_count_;
    return {};
}

} // namespace ufg::gpu
