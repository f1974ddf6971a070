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

#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database(){}

void database::set_vault_ledger( std::shared_ptr<vault_ledger> ledger )
{
   FC_ASSERT( ledger != nullptr );
   _vault_ledger = std::move( ledger );
}

void database::register_join( asset_id_type asset, std::shared_ptr<asset_join> join )
{
   FC_ASSERT( join != nullptr );
   _joins[asset] = std::move( join );
}

void database::register_debt_token( asset_id_type base, std::shared_ptr<debt_token> token )
{
   FC_ASSERT( token != nullptr );
   _debt_tokens[base] = std::move( token );
}

vault_ledger& database::get_vault_ledger()const
{
   WITCH_ASSERT( _vault_ledger != nullptr, missing_collaborator, "No vault ledger attached" );
   return *_vault_ledger;
}

asset_join& database::get_join( asset_id_type asset )const
{
   auto itr = _joins.find( asset );
   WITCH_ASSERT( itr != _joins.end(), missing_collaborator, "No join registered for asset ${a}", ("a",asset) );
   return *itr->second;
}

void database::on_undo( std::function<void()> revert )
{
   _undo_db.on_external_change( std::move( revert ) );
}

debt_token& database::get_debt_token( asset_id_type base )const
{
   auto itr = _debt_tokens.find( base );
   WITCH_ASSERT( itr != _debt_tokens.end(), missing_collaborator,
                 "No debt token registered for debt asset ${b}", ("b",base) );
   return *itr->second;
}

} }
