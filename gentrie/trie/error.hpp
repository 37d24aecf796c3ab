/*
 * error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Exceptions raised by the trie engine

**************************************************/

#ifndef GENTRIE_TRIE_ERROR_HPP
#define GENTRIE_TRIE_ERROR_HPP

#include "gentrie/error/exception.hpp"

namespace gentrie {

/**
 * @brief A broken key bijection or a corrupted trie node.
 *
 * Raised when an operation reaches a Void position or finds a node that
 * violates the no-dead-branch invariant. The trie it was raised from must
 * not be used further.
 */
class TrieInvariantError : public error::Exception {
public:
    using Exception::Exception;
};

#define THROW_TRIE_INVARIANT_ERROR(...)                                   \
    throw gentrie::TrieInvariantError(GENTRIE_FILE_NAME, GENTRIE_FILE_LINE, \
                                      GENTRIE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A sequence key longer than GENTRIE_MAX_SEQUENCE_DEPTH.
 *
 * Raised before the trie is touched, so the trie is left unchanged.
 */
class KeyDepthError : public error::Exception {
public:
    using Exception::Exception;
};

#define THROW_KEY_DEPTH_ERROR(...)                                   \
    throw gentrie::KeyDepthError(GENTRIE_FILE_NAME, GENTRIE_FILE_LINE, \
                                 GENTRIE_FUNC_NAME, __VA_ARGS__)

}  // namespace gentrie

#endif  // GENTRIE_TRIE_ERROR_HPP
