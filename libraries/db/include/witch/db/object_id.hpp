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
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace witch { namespace db {

   /**
    *  An object id packs the id space (8 bits), the object type within the space (8 bits)
    *  and a sequential instance number (48 bits) into a single 64 bit number.
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits          = 48;
      static constexpr uint8_t  type_and_instance_bits = 56;
      static constexpr uint64_t one_byte_mask          = 0x00ff;
      static constexpr uint64_t max_instance           = 0x0000ffffffffffff;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i ){ reset( s, t, i ); }

      void reset( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> instance_bits == 0, "instance overflow", ("instance",i) );
         number = ( (uint64_t(s) << type_and_instance_bits) | (uint64_t(t) << instance_bits) ) | i;
      }

      uint8_t  space()const      { return number >> type_and_instance_bits; }
      uint8_t  type()const       { return (number >> instance_bits) & one_byte_mask; }
      uint16_t space_type()const { return number >> instance_bits; }
      uint64_t instance()const   { return number & max_instance; }
      bool     is_null()const    { return 0 == number; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool operator >  ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      object_id_type& operator++() { ++number; return *this; }

      template< typename T >
      bool is()const { return space_type() == T::space_type; }

      explicit operator std::string()const
      {
         return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      uint64_t number = 0;
   };

   class object;

   /// Maps a typed id to the object class stored under it, see MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };

#define MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace witch { namespace db { \
   template<> \
   struct object_downcast<const witch::db::object_id<OBJECT::space_id, \
                                                     OBJECT::type_id>&> { using type = OBJECT; }; \
   } }

   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t  type_bits     = 8;
      static constexpr uint8_t  instance_bits = 48;
      static constexpr uint64_t max_instance  = 0x0000ffffffffffff;

      static constexpr uint8_t  space_id   = SpaceID;
      static constexpr uint8_t  type_id    = TypeID;
      static constexpr uint16_t space_type = uint16_t(uint16_t(space_id) << type_bits) | uint16_t(type_id);

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (instance >> instance_bits) == 0, "instance overflow", ("instance",instance) );
      }
      explicit object_id( const object_id_type& id ):instance(id.instance())
      {
         FC_ASSERT( id.is<object_id>(), "space or type mismatch", ("id",std::string(id)) );
      }

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }

      template<typename DB>
      auto operator()(const DB& db)const -> const decltype(db.get(*this))& { return db.get(*this); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }
      friend bool operator == ( const object_id& a, const object_id_type& b ) { return object_id_type(a) == b; }
      friend bool operator <  ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }
      friend bool operator >  ( const object_id& a, const object_id& b ) { return a.instance > b.instance; }

      explicit operator std::string()const
      {
         return fc::to_string(space_id) + "." + fc::to_string(type_id) + "." + fc::to_string(instance);
      }

      uint64_t instance = 0;
   };

} } // witch::db

FC_REFLECT( witch::db::object_id_type, (number) )

namespace fc {

   template<uint8_t SpaceID, uint8_t TypeID>
   struct get_typename<witch::db::object_id<SpaceID,TypeID>>
   {
      static const char* name()
      {
         static std::string _str = std::string("witch::db::object_id<") + fc::to_string(SpaceID) + ":"
                                                                        + fc::to_string(TypeID) + ">";
         return _str.c_str();
      }
   };

   void to_variant( const witch::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, witch::db::object_id_type& vo, uint32_t max_depth = 1 );

   template<uint8_t SpaceID, uint8_t TypeID>
   void to_variant( const witch::db::object_id<SpaceID,TypeID>& var, fc::variant& vo, uint32_t max_depth = 1 )
   {
      vo = std::string( var );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   void from_variant( const fc::variant& var, witch::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
   { try {
      witch::db::object_id_type generic;
      from_variant( var, generic, max_depth );
      vo = witch::db::object_id<SpaceID,TypeID>( generic );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

} // fc

namespace std {
   template <> struct hash<witch::db::object_id_type>
   {
      size_t operator()( const witch::db::object_id_type& x )const
      {
         return std::hash<uint64_t>()(x.number);
      }
   };
}
