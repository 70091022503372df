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

#include "td/utils/Status.h"

#include "trace-types.h"

#include <msgpack.hpp>

namespace indexer {

td::Result<AccStatusChange> parse_status_change(td::int64 code);
td::Result<ComputeSkipReason> parse_skip_reason(td::int64 code);

td::Result<TrStoragePhase> parse_tr_storage_phase(const msgpack::object &obj);
td::Result<TrCreditPhase> parse_tr_credit_phase(const msgpack::object &obj);
td::Result<TrComputePhase> parse_tr_compute_phase(const msgpack::object &obj);
td::Result<StorageUsedShort> parse_storage_used_short(const msgpack::object &obj);
td::Result<TrActionPhase> parse_tr_action_phase(const msgpack::object &obj);
td::Result<TrBouncePhase> parse_tr_bounce_phase(const msgpack::object &obj);

// (credit_first, storage_ph, credit_ph, compute_ph, action?, aborted, bounce?, destroyed)
td::Result<TransactionDescr> parse_transaction_descr(const msgpack::object &obj);

}  // namespace indexer
