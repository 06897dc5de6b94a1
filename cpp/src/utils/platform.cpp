/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the OS-specific utilities in hbl_platform.hpp.
 */
#include "hbl_base.hpp"

#include <cstdlib>
#include <thread>
#include <vector>

#if defined(HUBLINK_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(HUBLINK_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace hublink::platform
{

uint64_t get_pid()
{
#if defined(HUBLINK_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(HUBLINK_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(HUBLINK_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(HUBLINK_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::filesystem::path get_executable_dir() noexcept
{
    try
    {
#if defined(HUBLINK_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
        if (count > 0)
        {
            return std::filesystem::path(std::string(buf.data(), static_cast<size_t>(count)))
                .parent_path();
        }
#elif defined(HUBLINK_PLATFORM_APPLE)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::string path(size, '\0');
        if (_NSGetExecutablePath(path.data(), &size) == 0)
            return std::filesystem::canonical(std::filesystem::path(path.c_str())).parent_path();
#elif defined(HUBLINK_PLATFORM_WIN64)
        std::vector<wchar_t> buf(32767);
        DWORD len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len > 0)
            return std::filesystem::path(std::wstring(buf.data(), len)).parent_path();
#endif
    }
    catch (const std::exception &)
    {
        // Fall through: an unknown location is reported as an empty path.
    }
    return {};
}

std::filesystem::path get_home_dir() noexcept
{
#if defined(HUBLINK_PLATFORM_WIN64)
    const char *home = std::getenv("USERPROFILE");
#else
    const char *home = std::getenv("HOME");
#endif
    if (home != nullptr && *home != '\0')
        return std::filesystem::path(home);
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path{} : tmp;
}

} // namespace hublink::platform
