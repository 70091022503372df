/*
    This file is part of TON Blockchain Library.

    TON Blockchain Library is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    TON Blockchain Library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with TON Blockchain Library.  If not, see <http://www.gnu.org/licenses/>.
*/
#pragma once

#include "td/utils/Slice.h"
#include "td/utils/Status.h"

#include "trace-types.h"

#include <msgpack.hpp>

namespace indexer {

td::Result<AccountStatus> parse_account_status(td::int64 code);

// (msg_hash, source, destination, value, fwd_fee, ihr_fee, created_lt, created_at, opcode,
//  ihr_disabled, bounce, bounced, import_fee, body, init_state)
td::Result<Message> parse_message(const msgpack::object &obj, const std::string &tx_hash, td::uint64 tx_lt,
                                  MessageDirection direction);

// Decodes one record ((transaction_tuple), emulated) produced by the trace serializer.
// The whole buffer must be consumed by exactly one msgpack value.
td::Result<Transaction> decode_transaction(td::Slice data);

}  // namespace indexer
