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
#include <witch/db/object_id.hpp>

#include <fc/variant.hpp>

#include <memory>

#define WITCH_MAX_NESTING (200)

namespace witch { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  The object is the unit on which undo operations are performed. Every object gets a
    *  unique and sequential id from the index that stores it, within the id space and type
    *  declared by the derived class.
    *
    *  Objects must be cheap to copy: they refer to other objects by id only.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object() = default;
         virtual ~object() = default;

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         object_id_type id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual std::unique_ptr<object> clone()const = 0;
         virtual void                    move_from( object& obj ) = 0;
         virtual fc::variant             to_variant()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Use the Curiously Recurring Template Pattern to add polymorphic clone, move and
    *  serialization to an object type.
    */
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         std::unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( *static_cast<const DerivedClass*>(this) );
         }

         void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }

         fc::variant to_variant()const override
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), WITCH_MAX_NESTING );
         }
   };

} } // witch::db

FC_REFLECT( witch::db::object, (id) )
