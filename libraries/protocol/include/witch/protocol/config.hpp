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

/** Fixed point scale shared by every fraction: proportions, offers and elapsed time ratios */
#define WITCH_ONE                     uint64_t( 1000000000000000000ull )
#define WITCH_1_PERCENT               ( WITCH_ONE / 100 )

#define WITCH_MIN_INITIAL_OFFER       WITCH_1_PERCENT
#define WITCH_MAX_INITIAL_OFFER       WITCH_ONE
#define WITCH_MIN_PROPORTION          WITCH_1_PERCENT
#define WITCH_MAX_PROPORTION          WITCH_ONE

/** debt amounts are scaled by 10^decimals, larger scales cannot be represented */
#define WITCH_MAX_DEBT_DECIMALS       30
