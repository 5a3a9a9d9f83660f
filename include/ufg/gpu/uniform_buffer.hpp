/**
 * @file uniform_buffer.hpp
 * @brief CPU-side packed uniform block storage + the upload seam uwu
 *
 * a UniformBuffer is the flat 32-bit array that a sync procedure writes into
 * every frame. it is owned by the uniform group, borrowed by the procedure for
 * the duration of one call, and handed to a BufferUploader which pushes the
 * bytes wherever the backend wants them (a VMA mapped allocation, a host
 * mirror in tests, ...).
 *
 * uploads report failures through std::expected; the sync procedure forwards
 * them untouched and never retries.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace ufg::gpu
{

/**
 * @brief upload failure payload (message + breadcrumbs)
 */
struct UploadError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief packed std140 block storage, size_bytes / 4 float elements
 */
class UniformBuffer
{
public:
    UniformBuffer() = default;

    explicit UniformBuffer(std::size_t size_bytes);

    /**
     * @brief replace contents with a zeroed array of size_bytes / 4 elements
     *
     * @param[in] size_bytes block size, expected to be a multiple of 16
     */
    void reset(std::size_t size_bytes);

    [[nodiscard]] auto data() noexcept -> std::span<float> { return {data_.data(), data_.size()}; }
    [[nodiscard]] auto data() const noexcept -> std::span<const float> { return {data_.data(), data_.size()}; }
    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte> { return std::as_bytes(data()); }
    [[nodiscard]] auto size_bytes() const noexcept -> std::size_t { return data_.size() * sizeof(float); }

    /// monotonic counter bumped whenever the contents were rewritten
    [[nodiscard]] auto update_id() const noexcept -> std::uint64_t { return update_id_; }

    void mark_updated() noexcept { ++update_id_; }

private:
    std::vector<float> data_;
    std::uint64_t      update_id_{0U};
};

/**
 * @brief backend hook that makes the packed bytes visible to the GPU
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (implementations touch device memory or host mirrors)
 */
class BufferUploader
{
public:
    BufferUploader()                                   = default;
    BufferUploader(const BufferUploader &)             = default;
    auto operator=(const BufferUploader &) -> BufferUploader & = default;
    BufferUploader(BufferUploader &&) noexcept         = default;
    auto operator=(BufferUploader &&) noexcept -> BufferUploader & = default;
    virtual ~BufferUploader()                          = default;

    /**
     * @brief push the current contents of @p buffer
     *
     * @param[in,out] buffer packed block (non-const so backends may track update ids)
     * @return empty on success or UploadError
     */
    virtual auto update(UniformBuffer &buffer) -> std::expected<void, UploadError> = 0;
};

/**
 * @brief uploader that copies bytes into a host-side mirror (headless tools + tests)
 */
class HostMirrorUploader final : public BufferUploader
{
public:
    auto update(UniformBuffer &buffer) -> std::expected<void, UploadError> override;

    [[nodiscard]] auto mirror() const noexcept -> std::span<const std::byte> { return {mirror_.data(), mirror_.size()}; }
    [[nodiscard]] auto upload_count() const noexcept -> std::size_t { return upload_count_; }
    [[nodiscard]] auto last_update_id() const noexcept -> std::uint64_t { return last_update_id_; }

private:
    std::vector<std::byte> mirror_;
    std::size_t            upload_count_{0U};
    std::uint64_t          last_update_id_{0U};
};

} // namespace ufg::gpu
