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

#include "td/utils/common.h"
#include "td/utils/Slice.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace indexer {

enum class AccountStatus { uninit, frozen, active, nonexist };

enum class AccStatusChange { unchanged, frozen, deleted };

enum class ComputeSkipReason { no_state, bad_state, no_gas, suspended };

enum class MessageDirection { in, out };

td::Slice to_string(AccountStatus status);
td::Slice to_string(AccStatusChange status_change);
td::Slice to_string(ComputeSkipReason reason);
td::Slice to_string(MessageDirection direction);

struct TrStoragePhase {
  td::uint64 storage_fees_collected{0};
  std::optional<td::uint64> storage_fees_due;
  AccStatusChange status_change{AccStatusChange::unchanged};
};

struct TrCreditPhase {
  std::optional<td::uint64> due_fees_collected;
  td::uint64 credit{0};
};

struct TrComputePhase_skipped {
  ComputeSkipReason reason;
};

struct TrComputePhase_vm {
  bool success{false};
  bool msg_state_used{false};
  bool account_activated{false};
  td::uint64 gas_fees{0};
  td::uint64 gas_used{0};
  td::uint64 gas_limit{0};
  std::optional<td::uint64> gas_credit;
  td::int32 mode{0};
  td::int32 exit_code{0};
  std::optional<td::int32> exit_arg;
  td::uint32 vm_steps{0};
  std::string vm_init_state_hash;
  std::string vm_final_state_hash;
};

using TrComputePhase = std::variant<TrComputePhase_skipped, TrComputePhase_vm>;

struct StorageUsedShort {
  td::uint64 cells{0};
  td::uint64 bits{0};
};

struct TrActionPhase {
  bool success{false};
  bool valid{false};
  bool no_funds{false};
  AccStatusChange status_change{AccStatusChange::unchanged};
  std::optional<td::uint64> total_fwd_fees;
  std::optional<td::uint64> total_action_fees;
  td::int32 result_code{0};
  std::optional<td::int32> result_arg;
  td::uint32 tot_actions{0};
  td::uint32 spec_actions{0};
  td::uint32 skipped_actions{0};
  td::uint32 msgs_created{0};
  std::string action_list_hash;
  StorageUsedShort tot_msg_size;
};

struct TrBouncePhase_negfunds {};

struct TrBouncePhase_nofunds {
  StorageUsedShort msg_size;
  td::uint64 req_fwd_fees{0};
};

struct TrBouncePhase_ok {
  StorageUsedShort msg_size;
  td::uint64 msg_fees{0};
  td::uint64 fwd_fees{0};
};

using TrBouncePhase = std::variant<TrBouncePhase_negfunds, TrBouncePhase_nofunds, TrBouncePhase_ok>;

// Ordinary transaction description, the only kind the upstream serializer emits.
struct TransactionDescr {
  bool credit_first{false};
  TrStoragePhase storage_ph;
  TrCreditPhase credit_ph;
  TrComputePhase compute_ph{TrComputePhase_skipped{ComputeSkipReason::no_state}};
  std::optional<TrActionPhase> action;
  bool aborted{false};
  std::optional<TrBouncePhase> bounce;
  bool destroyed{false};
};

struct Message {
  std::string msg_hash;
  std::string tx_hash;
  td::uint64 tx_lt{0};
  MessageDirection direction{MessageDirection::in};

  std::optional<std::string> source;
  std::optional<std::string> destination;
  std::optional<td::uint64> value;
  std::optional<td::uint64> fwd_fee;
  std::optional<td::uint64> ihr_fee;
  std::optional<td::uint64> created_lt;
  std::optional<td::uint32> created_at;
  std::optional<td::int32> opcode;
  std::optional<bool> ihr_disabled;
  std::optional<bool> bounce;
  std::optional<bool> bounced;
  std::optional<td::uint64> import_fee;

  std::string body_boc;
  std::optional<std::string> init_state_boc;
};

struct Transaction {
  std::string hash;
  std::string account;
  td::uint64 lt{0};
  std::string prev_trans_hash;
  td::uint64 prev_trans_lt{0};
  td::uint32 now{0};

  AccountStatus orig_status{AccountStatus::uninit};
  AccountStatus end_status{AccountStatus::uninit};

  td::uint64 total_fees{0};

  std::string account_state_hash_before;
  std::string account_state_hash_after;

  bool emulated{false};

  TransactionDescr description;

  // out messages first, the in message is always the last one
  std::vector<Message> messages;

  const Message &in_msg() const {
    return messages.back();
  }
  size_t out_msgs_count() const {
    return messages.empty() ? 0 : messages.size() - 1;
  }
};

struct TraceEdge {
  std::string left_tx;
  std::string right_tx;
  std::string msg_hash;
  std::string trace_id;
};

enum class ClassificationState { unclassified, ok, failed };

enum class TraceState { complete, pending };

td::Slice to_string(ClassificationState state);
td::Slice to_string(TraceState state);

struct Trace {
  std::string trace_id;
  std::vector<Transaction> transactions;
  std::vector<TraceEdge> edges;
  ClassificationState classification_state{ClassificationState::unclassified};
  TraceState state{TraceState::pending};
};

}  // namespace indexer
