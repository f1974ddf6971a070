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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <witch/db/object_id.hpp>
#include <witch/protocol/config.hpp>

#define WITCH_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define WITCH_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define WITCH_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            WITCH_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define WITCH_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(witch::id_namespace::name)

#define WITCH_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace witch { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(WITCH_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(WITCH_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(witch::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(WITCH_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(WITCH_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(WITCH_NAME_TO_ID_TYPE, , names_seq))

namespace witch { namespace protocol {
   using namespace witch::db;

   using std::map;
   using std::vector;
   using std::string;
   using std::unique_ptr;
   using std::shared_ptr;

   using fc::flat_map;
   using fc::flat_set;
   using fc::optional;
   using fc::static_variant;
   using fc::time_point_sec;
   using fc::variant;

   /**
    *  Collateral and debt balances.  Unsigned and checked: any overflow or underflow throws,
    *  which aborts the operation that produced it.
    */
   using amount_type      = boost::multiprecision::checked_uint128_t;
   /** Holds intermediate products of two or three amounts */
   using wide_amount_type = boost::multiprecision::checked_uint256_t;

   /** A fraction of WITCH_ONE */
   using fraction_type = uint64_t;

   struct void_t{};

   enum reserved_spaces
   {
      protocol_ids          = 1,
      implementation_ids    = 2
   };

} }  // witch::protocol

namespace fc {

   void to_variant( const witch::protocol::amount_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, witch::protocol::amount_type& vo, uint32_t max_depth = 1 );

} // fc

/// Object types in the Protocol Space (enum object_type (1.x.x))
WITCH_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                 /* 1.0.x  */ (null) // no data
                 /* 1.1.x  */ (account)
                 /* 1.2.x  */ (asset)
                 /* 1.3.x  */ (vault)
                )

FC_REFLECT_TYPENAME( witch::protocol::amount_type )
FC_REFLECT( witch::protocol::void_t, )
