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

#define KITTIES_SYMBOL "KITTY"

#define KITTIES_MIN_ACCOUNT_NAME_LENGTH 1
#define KITTIES_MAX_ACCOUNT_NAME_LENGTH 63

#define KITTIES_MAX_SHARE_SUPPLY int64_t(1000000000000000000ll)

/** size in bytes of a kitty genome and of a breeding selector */
#define KITTIES_DNA_SIZE 16

#define KITTIES_DEFAULT_RANDOM_SEED "kitties-genesis"

#define KITTIES_DEFAULT_GENESIS_TIMESTAMP 1431700000

/** upper bound on operations carried by a single transaction */
#define KITTIES_MAX_OPERATIONS_PER_TRANSACTION 256

/** seconds between consecutive blocks */
#define KITTIES_BLOCK_INTERVAL 5
