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
#include "phase-decoder.h"

#include "msgpack-reader.h"

namespace indexer {

td::Result<AccStatusChange> parse_status_change(td::int64 code) {
  switch (code) {
    case 0:
      return AccStatusChange::unchanged;
    case 1:
      return AccStatusChange::frozen;
    case 2:
      return AccStatusChange::deleted;
    default:
      return td::Status::Error(ErrorCode::decode_error, PSLICE() << "unknown status change code " << code);
  }
}

td::Result<ComputeSkipReason> parse_skip_reason(td::int64 code) {
  switch (code) {
    case 0:
      return ComputeSkipReason::no_state;
    case 1:
      return ComputeSkipReason::bad_state;
    case 2:
      return ComputeSkipReason::no_gas;
    case 3:
      return ComputeSkipReason::suspended;
    default:
      return td::Status::Error(ErrorCode::decode_error, PSLICE() << "unknown compute skip reason " << code);
  }
}

td::Result<TrStoragePhase> parse_tr_storage_phase(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 3, "storage_ph"));
  TrStoragePhase phase;
  TRY_STATUS(mp::read(f[0], phase.storage_fees_collected, "storage_ph.storage_fees_collected"));
  TRY_STATUS(mp::read(f[1], phase.storage_fees_due, "storage_ph.storage_fees_due"));
  td::int64 status_change;
  TRY_STATUS(mp::read(f[2], status_change, "storage_ph.status_change"));
  TRY_RESULT_ASSIGN(phase.status_change, parse_status_change(status_change));
  return phase;
}

td::Result<TrCreditPhase> parse_tr_credit_phase(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 2, "credit_ph"));
  TrCreditPhase phase;
  TRY_STATUS(mp::read(f[0], phase.due_fees_collected, "credit_ph.due_fees_collected"));
  TRY_STATUS(mp::read(f[1], phase.credit, "credit_ph.credit"));
  return phase;
}

td::Result<TrComputePhase> parse_tr_compute_phase(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 2, "compute_ph"));
  int tag;
  TRY_STATUS(mp::read(f[0], tag, "compute_ph.tag"));
  switch (tag) {
    case 0: {
      TRY_RESULT(p, mp::unpack_tuple(f[1], 1, "compute_ph.skipped"));
      td::int64 reason;
      TRY_STATUS(mp::read(p[0], reason, "compute_ph.skipped.reason"));
      TRY_RESULT(skip_reason, parse_skip_reason(reason));
      return TrComputePhase_skipped{skip_reason};
    }
    case 1: {
      TRY_RESULT(p, mp::unpack_tuple(f[1], 13, "compute_ph.vm"));
      TrComputePhase_vm res;
      TRY_STATUS(mp::read(p[0], res.success, "compute_ph.vm.success"));
      TRY_STATUS(mp::read(p[1], res.msg_state_used, "compute_ph.vm.msg_state_used"));
      TRY_STATUS(mp::read(p[2], res.account_activated, "compute_ph.vm.account_activated"));
      TRY_STATUS(mp::read(p[3], res.gas_fees, "compute_ph.vm.gas_fees"));
      TRY_STATUS(mp::read(p[4], res.gas_used, "compute_ph.vm.gas_used"));
      TRY_STATUS(mp::read(p[5], res.gas_limit, "compute_ph.vm.gas_limit"));
      TRY_STATUS(mp::read(p[6], res.gas_credit, "compute_ph.vm.gas_credit"));
      TRY_STATUS(mp::read(p[7], res.mode, "compute_ph.vm.mode"));
      TRY_STATUS(mp::read(p[8], res.exit_code, "compute_ph.vm.exit_code"));
      TRY_STATUS(mp::read(p[9], res.exit_arg, "compute_ph.vm.exit_arg"));
      TRY_STATUS(mp::read(p[10], res.vm_steps, "compute_ph.vm.vm_steps"));
      TRY_STATUS(mp::read(p[11], res.vm_init_state_hash, "compute_ph.vm.vm_init_state_hash"));
      TRY_STATUS(mp::read(p[12], res.vm_final_state_hash, "compute_ph.vm.vm_final_state_hash"));
      return res;
    }
    default:
      return td::Status::Error(ErrorCode::decode_error, PSLICE() << "unknown compute phase tag " << tag);
  }
}

td::Result<StorageUsedShort> parse_storage_used_short(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 2, "storage_used_short"));
  StorageUsedShort res;
  TRY_STATUS(mp::read(f[0], res.cells, "storage_used_short.cells"));
  TRY_STATUS(mp::read(f[1], res.bits, "storage_used_short.bits"));
  return res;
}

td::Result<TrActionPhase> parse_tr_action_phase(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 14, "action"));
  TrActionPhase res;
  TRY_STATUS(mp::read(f[0], res.success, "action.success"));
  TRY_STATUS(mp::read(f[1], res.valid, "action.valid"));
  TRY_STATUS(mp::read(f[2], res.no_funds, "action.no_funds"));
  td::int64 status_change;
  TRY_STATUS(mp::read(f[3], status_change, "action.status_change"));
  TRY_RESULT_ASSIGN(res.status_change, parse_status_change(status_change));
  TRY_STATUS(mp::read(f[4], res.total_fwd_fees, "action.total_fwd_fees"));
  TRY_STATUS(mp::read(f[5], res.total_action_fees, "action.total_action_fees"));
  TRY_STATUS(mp::read(f[6], res.result_code, "action.result_code"));
  TRY_STATUS(mp::read(f[7], res.result_arg, "action.result_arg"));
  TRY_STATUS(mp::read(f[8], res.tot_actions, "action.tot_actions"));
  TRY_STATUS(mp::read(f[9], res.spec_actions, "action.spec_actions"));
  TRY_STATUS(mp::read(f[10], res.skipped_actions, "action.skipped_actions"));
  TRY_STATUS(mp::read(f[11], res.msgs_created, "action.msgs_created"));
  TRY_STATUS(mp::read(f[12], res.action_list_hash, "action.action_list_hash"));
  TRY_RESULT_ASSIGN(res.tot_msg_size, parse_storage_used_short(f[13]));
  return res;
}

td::Result<TrBouncePhase> parse_tr_bounce_phase(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 2, "bounce"));
  int tag;
  TRY_STATUS(mp::read(f[0], tag, "bounce.tag"));
  switch (tag) {
    case 0:
      return TrBouncePhase_negfunds{};
    case 1: {
      TRY_RESULT(p, mp::unpack_tuple(f[1], 2, "bounce.nofunds"));
      TrBouncePhase_nofunds res;
      TRY_RESULT_ASSIGN(res.msg_size, parse_storage_used_short(p[0]));
      TRY_STATUS(mp::read(p[1], res.req_fwd_fees, "bounce.nofunds.req_fwd_fees"));
      return res;
    }
    case 2: {
      TRY_RESULT(p, mp::unpack_tuple(f[1], 3, "bounce.ok"));
      TrBouncePhase_ok res;
      TRY_RESULT_ASSIGN(res.msg_size, parse_storage_used_short(p[0]));
      TRY_STATUS(mp::read(p[1], res.msg_fees, "bounce.ok.msg_fees"));
      TRY_STATUS(mp::read(p[2], res.fwd_fees, "bounce.ok.fwd_fees"));
      return res;
    }
    default:
      return td::Status::Error(ErrorCode::decode_error, PSLICE() << "unknown bounce phase tag " << tag);
  }
}

td::Result<TransactionDescr> parse_transaction_descr(const msgpack::object &obj) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 8, "description"));
  TransactionDescr res;
  TRY_STATUS(mp::read(f[0], res.credit_first, "description.credit_first"));
  TRY_RESULT_ASSIGN(res.storage_ph, parse_tr_storage_phase(f[1]));
  TRY_RESULT_ASSIGN(res.credit_ph, parse_tr_credit_phase(f[2]));
  TRY_RESULT_ASSIGN(res.compute_ph, parse_tr_compute_phase(f[3]));
  if (f[4].type != msgpack::type::NIL) {
    TRY_RESULT_ASSIGN(res.action, parse_tr_action_phase(f[4]));
  }
  TRY_STATUS(mp::read(f[5], res.aborted, "description.aborted"));
  if (f[6].type != msgpack::type::NIL) {
    TRY_RESULT_ASSIGN(res.bounce, parse_tr_bounce_phase(f[6]));
  }
  TRY_STATUS(mp::read(f[7], res.destroyed, "description.destroyed"));
  return res;
}

}  // namespace indexer
