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
#include "transaction-decoder.h"

#include "msgpack-reader.h"
#include "phase-decoder.h"

namespace indexer {

namespace {

// Opcodes are 32-bit tags; the serializer may emit them either signed or unsigned.
td::Status read_opcode(const msgpack::object &obj, std::optional<td::int32> &opcode) {
  std::optional<td::int64> raw;
  TRY_STATUS(mp::read(obj, raw, "opcode"));
  if (!raw) {
    opcode.reset();
    return td::Status::OK();
  }
  if (raw.value() < std::numeric_limits<td::int32>::min() || raw.value() > std::numeric_limits<td::uint32>::max()) {
    return mp::bad_field("opcode", PSTRING() << "value " << raw.value() << " does not fit 32 bits");
  }
  opcode = static_cast<td::int32>(static_cast<td::uint32>(raw.value()));
  return td::Status::OK();
}

td::Result<Transaction> parse_transaction(const msgpack::object &root) {
  TRY_RESULT(record, mp::unpack_tuple(root, 2, "record"));
  TRY_RESULT(f, mp::unpack_tuple(record[0], 14, "transaction"));

  Transaction tx;
  TRY_STATUS(mp::read_hash(f[0], tx.hash, "hash"));

  auto status = [&]() -> td::Status {
    TRY_STATUS(mp::read(f[1], tx.account, "account"));
    TRY_STATUS(mp::read(f[2], tx.lt, "lt"));
    TRY_STATUS(mp::read_hash(f[3], tx.prev_trans_hash, "prev_trans_hash"));
    TRY_STATUS(mp::read(f[4], tx.prev_trans_lt, "prev_trans_lt"));
    TRY_STATUS(mp::read(f[5], tx.now, "now"));
    td::int64 orig_status, end_status;
    TRY_STATUS(mp::read(f[6], orig_status, "orig_status"));
    TRY_RESULT_ASSIGN(tx.orig_status, parse_account_status(orig_status));
    TRY_STATUS(mp::read(f[7], end_status, "end_status"));
    TRY_RESULT_ASSIGN(tx.end_status, parse_account_status(end_status));
    TRY_STATUS(mp::read(f[10], tx.total_fees, "total_fees"));
    TRY_STATUS(mp::read(f[11], tx.account_state_hash_before, "account_state_hash_before"));
    TRY_STATUS(mp::read(f[12], tx.account_state_hash_after, "account_state_hash_after"));
    TRY_RESULT_ASSIGN(tx.description, parse_transaction_descr(f[13]));
    TRY_STATUS(mp::read(record[1], tx.emulated, "emulated"));

    const auto &out_msgs = f[9];
    if (out_msgs.type != msgpack::type::ARRAY) {
      return mp::bad_field("out_msgs", PSTRING() << "expected array, got " << mp::type_name(out_msgs));
    }
    tx.messages.reserve(out_msgs.via.array.size + 1);
    for (td::uint32 i = 0; i < out_msgs.via.array.size; i++) {
      TRY_RESULT_PREFIX(msg, parse_message(out_msgs.via.array.ptr[i], tx.hash, tx.lt, MessageDirection::out),
                        PSLICE() << "out_msgs[" << i << "]: ");
      tx.messages.push_back(std::move(msg));
    }
    TRY_RESULT_PREFIX(in_msg, parse_message(f[8], tx.hash, tx.lt, MessageDirection::in), "in_msg: ");
    tx.messages.push_back(std::move(in_msg));
    return td::Status::OK();
  }();
  if (status.is_error()) {
    return status.move_as_error_prefix(PSLICE() << "transaction " << tx.hash << ": ");
  }
  return tx;
}

}  // namespace

td::Result<AccountStatus> parse_account_status(td::int64 code) {
  switch (code) {
    case 0:
      return AccountStatus::uninit;
    case 1:
      return AccountStatus::frozen;
    case 2:
      return AccountStatus::active;
    case 3:
      return AccountStatus::nonexist;
    default:
      return td::Status::Error(ErrorCode::decode_error, PSLICE() << "unknown account status code " << code);
  }
}

td::Result<Message> parse_message(const msgpack::object &obj, const std::string &tx_hash, td::uint64 tx_lt,
                                  MessageDirection direction) {
  TRY_RESULT(f, mp::unpack_tuple(obj, 15, "message"));
  Message msg;
  msg.tx_hash = tx_hash;
  msg.tx_lt = tx_lt;
  msg.direction = direction;
  TRY_STATUS(mp::read_hash(f[0], msg.msg_hash, "msg_hash"));
  TRY_STATUS(mp::read(f[1], msg.source, "source"));
  TRY_STATUS(mp::read(f[2], msg.destination, "destination"));
  TRY_STATUS(mp::read(f[3], msg.value, "value"));
  TRY_STATUS(mp::read(f[4], msg.fwd_fee, "fwd_fee"));
  TRY_STATUS(mp::read(f[5], msg.ihr_fee, "ihr_fee"));
  TRY_STATUS(mp::read(f[6], msg.created_lt, "created_lt"));
  TRY_STATUS(mp::read(f[7], msg.created_at, "created_at"));
  TRY_STATUS(read_opcode(f[8], msg.opcode));
  TRY_STATUS(mp::read(f[9], msg.ihr_disabled, "ihr_disabled"));
  TRY_STATUS(mp::read(f[10], msg.bounce, "bounce"));
  TRY_STATUS(mp::read(f[11], msg.bounced, "bounced"));
  TRY_STATUS(mp::read(f[12], msg.import_fee, "import_fee"));
  TRY_STATUS(mp::read(f[13], msg.body_boc, "body"));
  TRY_STATUS(mp::read(f[14], msg.init_state_boc, "init_state"));
  return msg;
}

td::Result<Transaction> decode_transaction(td::Slice data) {
  msgpack::object_handle handle;
  std::size_t offset = 0;
  try {
    handle = msgpack::unpack(data.data(), data.size(), offset);
  } catch (const std::exception &e) {
    return td::Status::Error(ErrorCode::decode_error, PSLICE() << "malformed msgpack: " << e.what());
  }
  if (offset != data.size()) {
    return td::Status::Error(ErrorCode::decode_error,
                             PSLICE() << "trailing " << data.size() - offset << " bytes after transaction record");
  }
  return parse_transaction(handle.get());
}

}  // namespace indexer
