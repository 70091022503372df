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
#include "trace-json.h"

#include "td/utils/JsonBuilder.h"
#include "td/utils/overloaded.h"

namespace indexer {

namespace {

// Unsigned 64-bit counters do not fit JSON numbers, they go out as strings.
template <class ObjT, class T>
void put_amount(ObjT &obj, td::Slice key, const std::optional<T> &value) {
  if (value) {
    obj(key, std::to_string(value.value()));
  } else {
    obj(key, td::JsonNull());
  }
}

template <class ObjT, class T>
void put_int(ObjT &obj, td::Slice key, const std::optional<T> &value) {
  if (value) {
    obj(key, static_cast<td::int64>(value.value()));
  } else {
    obj(key, td::JsonNull());
  }
}

template <class ObjT>
void put_bool(ObjT &obj, td::Slice key, const std::optional<bool> &value) {
  if (value) {
    obj(key, td::JsonBool(value.value()));
  } else {
    obj(key, td::JsonNull());
  }
}

template <class ObjT>
void put_string(ObjT &obj, td::Slice key, const std::optional<std::string> &value) {
  if (value) {
    obj(key, value.value());
  } else {
    obj(key, td::JsonNull());
  }
}

std::string jsonify(const StorageUsedShort &s) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("cells", std::to_string(s.cells));
  c("bits", std::to_string(s.bits));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const TrStoragePhase &s) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("storage_fees_collected", std::to_string(s.storage_fees_collected));
  put_amount(c, "storage_fees_due", s.storage_fees_due);
  c("status_change", to_string(s.status_change));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const TrCreditPhase &s) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  put_amount(c, "due_fees_collected", s.due_fees_collected);
  c("credit", std::to_string(s.credit));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const TrComputePhase &compute) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  std::visit(td::overloaded(
                 [&](const TrComputePhase_skipped &skipped) {
                   c("type", "skipped");
                   c("skip_reason", to_string(skipped.reason));
                 },
                 [&](const TrComputePhase_vm &computed) {
                   c("type", "vm");
                   c("success", td::JsonBool(computed.success));
                   c("msg_state_used", td::JsonBool(computed.msg_state_used));
                   c("account_activated", td::JsonBool(computed.account_activated));
                   c("gas_fees", std::to_string(computed.gas_fees));
                   c("gas_used", std::to_string(computed.gas_used));
                   c("gas_limit", std::to_string(computed.gas_limit));
                   put_amount(c, "gas_credit", computed.gas_credit);
                   c("mode", computed.mode);
                   c("exit_code", computed.exit_code);
                   put_int(c, "exit_arg", computed.exit_arg);
                   c("vm_steps", static_cast<td::int64>(computed.vm_steps));
                   c("vm_init_state_hash", computed.vm_init_state_hash);
                   c("vm_final_state_hash", computed.vm_final_state_hash);
                 }),
             compute);
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const TrActionPhase &action) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("success", td::JsonBool(action.success));
  c("valid", td::JsonBool(action.valid));
  c("no_funds", td::JsonBool(action.no_funds));
  c("status_change", to_string(action.status_change));
  put_amount(c, "total_fwd_fees", action.total_fwd_fees);
  put_amount(c, "total_action_fees", action.total_action_fees);
  c("result_code", action.result_code);
  put_int(c, "result_arg", action.result_arg);
  c("tot_actions", static_cast<td::int64>(action.tot_actions));
  c("spec_actions", static_cast<td::int64>(action.spec_actions));
  c("skipped_actions", static_cast<td::int64>(action.skipped_actions));
  c("msgs_created", static_cast<td::int64>(action.msgs_created));
  c("action_list_hash", action.action_list_hash);
  c("tot_msg_size", td::JsonRaw(jsonify(action.tot_msg_size)));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const TrBouncePhase &bounce) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  std::visit(td::overloaded([&](const TrBouncePhase_negfunds &) { c("type", "negfunds"); },
                            [&](const TrBouncePhase_nofunds &nofunds) {
                              c("type", "nofunds");
                              c("msg_size", td::JsonRaw(jsonify(nofunds.msg_size)));
                              c("req_fwd_fees", std::to_string(nofunds.req_fwd_fees));
                            },
                            [&](const TrBouncePhase_ok &ok) {
                              c("type", "ok");
                              c("msg_size", td::JsonRaw(jsonify(ok.msg_size)));
                              c("msg_fees", std::to_string(ok.msg_fees));
                              c("fwd_fees", std::to_string(ok.fwd_fees));
                            }),
             bounce);
  c.leave();
  return jb.string_builder().as_cslice().str();
}

}  // namespace

std::string to_json(const TransactionDescr &descr) {
  td::JsonBuilder jb;
  auto obj = jb.enter_object();
  obj("type", "ord");
  obj("credit_first", td::JsonBool(descr.credit_first));
  obj("storage_ph", td::JsonRaw(jsonify(descr.storage_ph)));
  obj("credit_ph", td::JsonRaw(jsonify(descr.credit_ph)));
  obj("compute_ph", td::JsonRaw(jsonify(descr.compute_ph)));
  if (descr.action) {
    obj("action", td::JsonRaw(jsonify(descr.action.value())));
  } else {
    obj("action", td::JsonNull());
  }
  obj("aborted", td::JsonBool(descr.aborted));
  if (descr.bounce) {
    obj("bounce", td::JsonRaw(jsonify(descr.bounce.value())));
  } else {
    obj("bounce", td::JsonNull());
  }
  obj("destroyed", td::JsonBool(descr.destroyed));
  obj.leave();
  return jb.string_builder().as_cslice().str();
}

std::string to_json(const Message &msg) {
  td::JsonBuilder jb;
  auto obj = jb.enter_object();
  obj("msg_hash", msg.msg_hash);
  obj("tx_hash", msg.tx_hash);
  obj("tx_lt", std::to_string(msg.tx_lt));
  obj("direction", to_string(msg.direction));
  put_string(obj, "source", msg.source);
  put_string(obj, "destination", msg.destination);
  put_amount(obj, "value", msg.value);
  put_amount(obj, "fwd_fee", msg.fwd_fee);
  put_amount(obj, "ihr_fee", msg.ihr_fee);
  put_amount(obj, "created_lt", msg.created_lt);
  put_int(obj, "created_at", msg.created_at);
  put_int(obj, "opcode", msg.opcode);
  put_bool(obj, "ihr_disabled", msg.ihr_disabled);
  put_bool(obj, "bounce", msg.bounce);
  put_bool(obj, "bounced", msg.bounced);
  put_amount(obj, "import_fee", msg.import_fee);
  obj("body", msg.body_boc);
  put_string(obj, "init_state", msg.init_state_boc);
  obj.leave();
  return jb.string_builder().as_cslice().str();
}

std::string to_json(const Transaction &tx) {
  td::JsonBuilder jb;
  auto obj = jb.enter_object();
  obj("hash", tx.hash);
  obj("account", tx.account);
  obj("lt", std::to_string(tx.lt));
  obj("prev_trans_hash", tx.prev_trans_hash);
  obj("prev_trans_lt", std::to_string(tx.prev_trans_lt));
  obj("now", static_cast<td::int64>(tx.now));
  obj("orig_status", to_string(tx.orig_status));
  obj("end_status", to_string(tx.end_status));
  obj("total_fees", std::to_string(tx.total_fees));
  obj("account_state_hash_before", tx.account_state_hash_before);
  obj("account_state_hash_after", tx.account_state_hash_after);
  obj("emulated", td::JsonBool(tx.emulated));
  obj("description", td::JsonRaw(to_json(tx.description)));
  td::JsonBuilder msgs_jb;
  auto msgs = msgs_jb.enter_array();
  for (const auto &msg : tx.messages) {
    msgs << td::JsonRaw(to_json(msg));
  }
  msgs.leave();
  obj("messages", td::JsonRaw(msgs_jb.string_builder().as_cslice()));
  obj.leave();
  return jb.string_builder().as_cslice().str();
}

std::string to_json(const Trace &trace) {
  td::JsonBuilder jb;
  auto obj = jb.enter_object();
  obj("trace_id", trace.trace_id);
  obj("classification_state", to_string(trace.classification_state));
  obj("state", to_string(trace.state));

  td::JsonBuilder txs_jb;
  auto txs = txs_jb.enter_array();
  for (const auto &tx : trace.transactions) {
    txs << td::JsonRaw(to_json(tx));
  }
  txs.leave();
  obj("transactions", td::JsonRaw(txs_jb.string_builder().as_cslice()));

  td::JsonBuilder edges_jb;
  auto edges = edges_jb.enter_array();
  for (const auto &edge : trace.edges) {
    auto value_builder = edges.enter_value();
    auto e = value_builder.enter_object();
    e("left_tx", edge.left_tx);
    e("right_tx", edge.right_tx);
    e("msg_hash", edge.msg_hash);
    e("trace_id", edge.trace_id);
  }
  edges.leave();
  obj("edges", td::JsonRaw(edges_jb.string_builder().as_cslice()));
  obj.leave();
  return jb.string_builder().as_cslice().str();
}

}  // namespace indexer
