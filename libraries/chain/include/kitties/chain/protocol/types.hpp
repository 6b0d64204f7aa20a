/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#pragma once
#include <fc/array.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/raw.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <kitties/chain/config.hpp>

namespace kitties
{
namespace chain
{

using std::make_pair;
using std::map;
using std::pair;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

using fc::optional;
using fc::safe;
using fc::static_variant;
using fc::time_point_sec;
using fc::variant;

struct void_t
{
};

typedef uint64_t account_id_type;

/**
 * Kitty ids are handed out sequentially from the kitties count and never
 * reused.  Any unsigned integral type works as long as it has a
 * std::numeric_limits<>::max() that marks the exhausted counter.
 */
typedef uint32_t kitty_index_type;

typedef safe<int64_t> share_type;

typedef fc::array<uint8_t, KITTIES_DNA_SIZE> kitty_dna_type;

} // namespace chain
} // namespace kitties

FC_REFLECT(kitties::chain::void_t, )
