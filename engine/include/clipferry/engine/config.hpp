#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace clipferry::engine
{

    struct EngineConfig
    {
        std::uint64_t size_limit_bytes{50ULL * 1024 * 1024};
        std::filesystem::path scratch_root{"downloads"};
        std::chrono::seconds operation_timeout{std::chrono::seconds{120}};
        unsigned audio_bitrate_kbps{192};
        std::string progressive_container{"mp4"};
    };

} // namespace clipferry::engine
