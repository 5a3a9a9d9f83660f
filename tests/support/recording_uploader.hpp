/**
 * @file recording_uploader.hpp
 * @brief test-only BufferUploader that snapshots every upload (and can be told to fail)
 */
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

#include "ufg/gpu/uniform_buffer.hpp"

namespace ufg::test_support
{

class RecordingUploader final : public gpu::BufferUploader
{
public:
    auto update(gpu::UniformBuffer &buffer) -> std::expected<void, gpu::UploadError> override
    {
        ++calls;
        if (fail_next)
        {
            fail_next = false;
            return std::unexpected(gpu::UploadError{"device lost", {"queue"}});
        }
        const auto words = buffer.data();
        snapshots.emplace_back(words.begin(), words.end());
        return {};
    }

    bool                            fail_next{false};
    std::size_t                     calls{0U};
    std::vector<std::vector<float>> snapshots;
};

} // namespace ufg::test_support
