/*
 * stacktrace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-12-4

Description: Call stack captured when a gentrie exception is raised

**************************************************/

#include "stacktrace.hpp"

#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <string_view>

#include <fmt/format.h>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace gentrie::error {

namespace {

#if defined(__APPLE__) || defined(__linux__)
constexpr int MAX_FRAMES = 64;

auto demangle(const char* mangled) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}

auto describeFrame(void* frame) -> std::string {
    const auto address = reinterpret_cast<std::uintptr_t>(frame);
    Dl_info info{};
    if (dladdr(frame, &info) == 0) {
        return fmt::format("<unknown function> at {:#x}", address);
    }

    const std::string function = info.dli_sname != nullptr
                                     ? demangle(info.dli_sname)
                                     : "<unknown function>";
    std::string_view module =
        info.dli_fname != nullptr ? info.dli_fname : "<unknown module>";
    if (const auto slash = module.find_last_of('/');
        slash != std::string_view::npos) {
        module.remove_prefix(slash + 1);
    }
    const auto base = reinterpret_cast<std::uintptr_t>(info.dli_fbase);
    return fmt::format("{} at {:#x} in {} (+{:#x})", function, address,
                       module, address - base);
}
#endif

}  // namespace

StackTrace::StackTrace() {
#if defined(__APPLE__) || defined(__linux__)
    void* frames[MAX_FRAMES];
    const int count = backtrace(frames, MAX_FRAMES);
    // Frame 0 is this constructor.
    if (count > 1) {
        frames_.assign(frames + 1, frames + count);
    }
#endif
}

auto StackTrace::toString() const -> std::string {
    std::string out = "Stack trace:\n";
#if defined(__APPLE__) || defined(__linux__)
    for (std::size_t i = 0; i < frames_.size(); ++i) {
        fmt::format_to(std::back_inserter(out), "\t[{}] {}\n", i,
                       describeFrame(frames_[i]));
    }
#else
    out += "\tStack trace not available on this platform.\n";
#endif
    return out;
}

}  // namespace gentrie::error
