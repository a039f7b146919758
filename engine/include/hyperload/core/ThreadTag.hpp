#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>
#endif

namespace hyperload::core
{

/// 스레드별 로그 태그/워커 인덱스 캐시.
/// - 부하 워커 스레드는 시작 직후 bindWorker(i)를 1회 호출한다 ("w0", "w1", ...)
/// - 그 외 스레드는 "main"
class ThreadTag
{
  public:
    static constexpr int kNotWorker = -1;

    static void bindWorker(int workerIndex) noexcept
    {
        workerIndex_() = workerIndex;
        writeTag_(workerIndex);
        (void)tid();
    }

    [[nodiscard]] static int workerIndex() noexcept { return workerIndex_(); }
    [[nodiscard]] static bool isWorker() noexcept { return workerIndex_() >= 0; }

    [[nodiscard]] static long tid() noexcept
    {
        thread_local long cached = computeTid_();
        return cached;
    }

    [[nodiscard]] static std::string_view tag() noexcept
    {
        auto &buf = buf_();
        if (buf[0] == '\0')
            writeTag_(workerIndex_());
        return std::string_view{buf.data()};
    }

  private:
    static int &workerIndex_() noexcept
    {
        thread_local int idx = kNotWorker;
        return idx;
    }

    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static std::array<char, 16> &buf_() noexcept
    {
        thread_local std::array<char, 16> buf{};
        return buf;
    }

    static void writeTag_(int idx) noexcept
    {
        auto &buf = buf_();
        if (idx < 0)
            std::snprintf(buf.data(), buf.size(), "main");
        else
            std::snprintf(buf.data(), buf.size(), "w%d", idx);
    }
};

} // namespace hyperload::core
