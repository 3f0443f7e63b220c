// ort_bridge/format.hpp
// std::format shim used by error and log messages.
//
// libstdc++ shipped <format> late. When the library does not advertise
// __cpp_lib_format we substitute "{}" placeholders left to right from
// operator<< renderings of the arguments. Format specs inside the braces
// are not interpreted by the fallback.

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#if defined(__cpp_lib_format) && (__cpp_lib_format >= 201907L)
    #include <format>
    #define ORT_BRIDGE_HAS_STD_FORMAT 1
#else
    #define ORT_BRIDGE_HAS_STD_FORMAT 0
#endif

namespace ort_bridge::detail {

#if ORT_BRIDGE_HAS_STD_FORMAT

template<class... Args>
[[nodiscard]] inline std::string format(std::format_string<Args...> fmt, Args&&... args)
{
    return std::format(fmt, std::forward<Args>(args)...);
}

#else

namespace format_impl {

template<class T>
inline void put(std::ostringstream& os, const T& v) { os << v; }

inline void put(std::ostringstream& os, const char* s) { os << (s ? s : "(null)"); }

// Copies literal text up to the next "{...}" placeholder, handling "{{" / "}}".
// Returns false when the format string has no placeholder left.
inline bool advance(std::ostringstream& os, std::string_view& fmt)
{
    while (!fmt.empty()) {
        const char c = fmt.front();
        if ((c == '{' || c == '}') && fmt.size() > 1 && fmt[1] == c) {
            os << c;
            fmt.remove_prefix(2);
            continue;
        }
        if (c == '{') {
            const auto close = fmt.find('}');
            if (close == std::string_view::npos) break;
            fmt.remove_prefix(close + 1);
            return true;
        }
        os << c;
        fmt.remove_prefix(1);
    }
    return false;
}

} // namespace format_impl

template<class... Args>
[[nodiscard]] inline std::string format(std::string_view fmt, const Args&... args)
{
    std::ostringstream os;
    bool extra = false;
    auto one = [&](const auto& arg) {
        if (!extra && format_impl::advance(os, fmt)) {
            format_impl::put(os, arg);
        } else {
            // More arguments than placeholders: keep them visible.
            os << (extra ? " " : " | ");
            extra = true;
            format_impl::put(os, arg);
        }
    };
    (one(args), ...);
    while (format_impl::advance(os, fmt)) {
        os << "{}";
    }
    return os.str();
}

#endif

} // namespace ort_bridge::detail
