/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-20

Description: Compiler helper macros shared by all gentrie modules

**************************************************/

#ifndef GENTRIE_MACRO_HPP
#define GENTRIE_MACRO_HPP

#if !defined(_MSVC_LANG) && __cplusplus < 202002L
#error "gentrie requires C++20"
#endif

#if defined(_MSC_VER)
#define GENTRIE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define GENTRIE_INLINE inline __attribute__((always_inline))
#else
#define GENTRIE_INLINE inline
#endif

#define GENTRIE_NODISCARD [[nodiscard]]

#define GENTRIE_FILE_NAME __FILE__
#define GENTRIE_FILE_LINE __LINE__
#define GENTRIE_FUNC_NAME __func__

#endif  // GENTRIE_MACRO_HPP
