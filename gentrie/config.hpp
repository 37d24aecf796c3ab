/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Compile-time configuration of the gentrie library. Every
             value can be overridden from the build system.

**************************************************/

#ifndef GENTRIE_CONFIG_HPP
#define GENTRIE_CONFIG_HPP

#include <cstddef>

/**
 * @brief Longest sequence key accepted by a trie.
 *
 * Operations on sequence keys recurse once per element, so the limit bounds
 * stack usage. The default keeps copy, merge, mapValues and destruction of
 * a map holding a key at the limit within an 8 MiB stack in unoptimized and
 * sanitizer builds. Raise it only for optimized builds or larger stacks.
 *
 * insert() rejects longer keys with gentrie::KeyDepthError; lookups and
 * erase() report them absent.
 */
#ifndef GENTRIE_MAX_SEQUENCE_DEPTH
#define GENTRIE_MAX_SEQUENCE_DEPTH 256
#endif

namespace gentrie::config {

inline constexpr std::size_t MAX_SEQUENCE_DEPTH = GENTRIE_MAX_SEQUENCE_DEPTH;

static_assert(MAX_SEQUENCE_DEPTH > 0,
              "GENTRIE_MAX_SEQUENCE_DEPTH must be positive");

}  // namespace gentrie::config

#endif  // GENTRIE_CONFIG_HPP
