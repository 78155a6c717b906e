#pragma once
#include <fmt/format.h>
#include <atomic>
#include <cstdio>
#include <utility>

// stderr diagnostics: "INFO: ..." (only with --verbose), "WARN: ...", "ERROR: ...".
namespace prc::log {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> v{false};
    return v;
}
inline void set_verbose(bool on) { verbose_flag().store(on); }

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
    if (!verbose_flag().load()) return;
    fmt::print(stderr, "INFO: {}\n", fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
    fmt::print(stderr, "WARN: {}\n", fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
    fmt::print(stderr, "ERROR: {}\n", fmt::format(f, std::forward<Args>(args)...));
}

}
