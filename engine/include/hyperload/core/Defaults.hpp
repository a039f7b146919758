#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hyperload::core::defaults
{

// ===== Run plan =====
inline constexpr std::size_t kConcurrency = 1;
inline constexpr std::size_t kTotalUnits = 1;
inline constexpr std::uint32_t kTimeoutSec = 30;

// ===== Result channel =====
// 채널 용량 = 워커 수 * kChannelSlotsPerWorker
inline constexpr std::size_t kChannelSlotsPerWorker = 2;

// ===== Latency histogram =====
inline constexpr int kHistogramSignificantDigits = 3;
inline constexpr std::uint64_t kHistogramLowestValueMs = 1;
inline constexpr std::uint64_t kHistogramInitialHighestMs = 60'000;

// ===== HTTP client =====
inline constexpr std::string_view kUserAgent = "hyperload/1.0";
inline constexpr int kHttpVersion = 11;

} // namespace hyperload::core::defaults
