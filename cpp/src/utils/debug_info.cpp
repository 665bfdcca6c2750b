#include "ckv_base.hpp"

#include <cstdint>
#include <new>
#include <vector>

#if defined(CHECKEDVAL_IS_POSIX)
#include <cxxabi.h>   // For __cxa_demangle
#include <dlfcn.h>    // For dladdr
#include <execinfo.h> // For backtrace, backtrace_symbols
#endif

namespace checkedval::debug
{

namespace // anonymous namespace
{
// Format into a fixed stack buffer so the common case never allocates.
// Returns false on a formatting error.
template <typename... Args>
inline bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];

        auto result =
            fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);

        const std::size_t needed = static_cast<std::size_t>(result.size);
        const std::size_t have = needed < STACK_BUF_SZ ? needed : STACK_BUF_SZ;
        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const fmt::format_error &)
    {
        return false;
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

#if defined(CHECKEDVAL_IS_POSIX)
std::string demangle(const char *mangled)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && dem)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return mangled;
}
#endif

} // namespace

void print_stack_trace() noexcept
{
    try
    {
#if defined(CHECKEDVAL_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        const int nframes = backtrace(callstack, kMaxFrames);
        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        char **symbols = backtrace_symbols(callstack, nframes);
        auto free_symbols = basics::make_scope_guard([symbols]() { std::free(symbols); });

        for (int i = 0; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_sname)
            {
                const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                safe_format_to_stderr("{} + {:#x}", demangle(dlinfo.dli_sname),
                                      static_cast<unsigned long long>(addr - saddr));
            }
            else if (symbols && symbols[i])
            {
                safe_format_to_stderr("{}", symbols[i]);
            }
            else
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
        std::fflush(stderr);
#else
        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        safe_format_to_stderr("  [Stack trace not available on this platform]\n");
#endif
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Error: Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Error: Stack trace generation failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace checkedval::debug
