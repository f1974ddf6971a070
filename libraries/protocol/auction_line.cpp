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

#include <witch/protocol/auction_line.hpp>

namespace witch { namespace protocol {

void auction_line_update_operation::validate()const
{
   WITCH_ASSERT( initial_offer >= WITCH_MIN_INITIAL_OFFER && initial_offer <= WITCH_MAX_INITIAL_OFFER,
                 invalid_parameter, "Initial offer ${o} must be between 1% and 100%", ("o",initial_offer) );
   WITCH_ASSERT( proportion >= WITCH_MIN_PROPORTION && proportion <= WITCH_MAX_PROPORTION,
                 invalid_parameter, "Proportion ${p} must be between 1% and 100%", ("p",proportion) );
}

} } // witch::protocol
