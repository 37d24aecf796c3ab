/*
 * stacktrace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-12-4

Description: Call stack captured when a gentrie exception is raised

**************************************************/

#ifndef GENTRIE_ERROR_STACKTRACE_HPP
#define GENTRIE_ERROR_STACKTRACE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace gentrie::error {

/**
 * @brief Captures the call stack at construction and renders it on demand.
 *
 * Only return addresses are recorded; symbols are resolved in toString(),
 * so capturing stays cheap enough to do for every thrown
 * gentrie::error::Exception.
 */
class StackTrace {
public:
    StackTrace();

    /**
     * @return One line per frame: function, address and module.
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return frames_.size();
    }

private:
    std::vector<void*> frames_;
};

}  // namespace gentrie::error

#endif  // GENTRIE_ERROR_STACKTRACE_HPP
