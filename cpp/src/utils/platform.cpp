/**
 * @file platform.cpp
 * @brief Cross-platform implementations of the process and thread queries declared in
 *        `checkedval::platform`.
 */
#include "ckv_base.hpp"

#include <functional>
#include <thread>
#include <vector>

#if defined(CHECKEDVAL_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(CHECKEDVAL_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

namespace checkedval::platform
{

uint64_t get_pid()
{
#if defined(CHECKEDVAL_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses `GetCurrentThreadId`, `pthread_threadid_np` or `syscall(SYS_gettid)`,
 *          falling back to a hash of `std::thread::id`.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(CHECKEDVAL_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(CHECKEDVAL_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(CHECKEDVAL_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(CHECKEDVAL_PLATFORM_WIN64)
        char buf[MAX_PATH];
        const DWORD len = GetModuleFileNameA(nullptr, buf, MAX_PATH);
        if (len == 0)
            return "unknown_win";
        full_path.assign(buf, len);
#elif defined(CHECKEDVAL_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        const ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
            return "unknown_linux";
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(CHECKEDVAL_PLATFORM_APPLE)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::vector<char> buf(size + 1, '\0');
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
            return "unknown_macos";
        full_path = buf.data();
#else
        return "unknown";
#endif
        if (include_path)
            return full_path;
        return std::string(format_tools::filename_only(full_path));
    }
    catch (const std::exception &)
    {
        return "unknown";
    }
}

} // namespace checkedval::platform
