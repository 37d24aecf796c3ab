/*
 * trie.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: Generic tries keyed by algebraic data types. Include this
             header to get every trie and key instance.

**************************************************/

#ifndef GENTRIE_TRIE_HPP
#define GENTRIE_TRIE_HPP

#include "gentrie/config.hpp"
#include "gentrie/leaf/bool_trie.hpp"
#include "gentrie/leaf/ordered_map.hpp"
#include "gentrie/leaf/sparse_int_map.hpp"
#include "gentrie/shape/key_shape.hpp"
#include "gentrie/shape/shape.hpp"
#include "gentrie/trie/derived_map.hpp"
#include "gentrie/trie/error.hpp"
#include "gentrie/trie/gtrie.hpp"
#include "gentrie/trie/instances.hpp"
#include "gentrie/trie/list.hpp"
#include "gentrie/trie/trie_key.hpp"

#endif  // GENTRIE_TRIE_HPP
