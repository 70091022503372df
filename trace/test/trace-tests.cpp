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
#include "td/utils/misc.h"
#include "td/utils/tests.h"

#include "common/indexer-errorcode.h"
#include "trace/phase-decoder.h"
#include "trace/trace-assembler.h"
#include "trace/trace-json.h"
#include "trace/transaction-decoder.h"
#include "tx-packer.h"

#include <map>
#include <set>

using namespace indexer;
using indexer::test::pack_object;
using indexer::test::pack_transaction;
using indexer::test::Packer;
using indexer::test::TestMessage;
using indexer::test::TestTransaction;

namespace {

const std::string kWallet = "0:83DFD552E63729B472FCBCC8C45EBCC6691702558B68EC7527E1BA403A0F31A8";
const std::string kReceiver = "0:2CF3B5B8C891E517C9ADDBDA1C0386A09CCACBB0E3FAF630B51CFC8152325ACB";

TestMessage external_in(std::string hash) {
  TestMessage msg;
  msg.hash = std::move(hash);
  msg.destination = kWallet;
  return msg;
}

TestMessage internal(std::string hash, const std::string &source, const std::string &destination, td::uint64 value) {
  TestMessage msg;
  msg.hash = std::move(hash);
  msg.source = source;
  msg.destination = destination;
  msg.value = value;
  msg.opcode = 0;
  return msg;
}

// Root `tx_root` with out messages m1 and m2; m1 creates tx_a which sends m3 creating tx_c; m2 creates tx_b.
PackedTransactions branching_trace() {
  TestTransaction root{"tx_root", kWallet, 100, external_in("ext_in")};
  root.out_msgs = {internal("m1", kWallet, kReceiver, 1000), internal("m2", kWallet, kReceiver, 2000)};
  TestTransaction a{"tx_a", kReceiver, 101, internal("m1", kWallet, kReceiver, 1000)};
  a.out_msgs = {internal("m3", kReceiver, kWallet, 500)};
  TestTransaction b{"tx_b", kReceiver, 102, internal("m2", kWallet, kReceiver, 2000)};
  TestTransaction c{"tx_c", kWallet, 103, internal("m3", kReceiver, kWallet, 500)};

  PackedTransactions packed;
  packed["tx_root"] = pack_transaction(root);
  packed["m1"] = pack_transaction(a);
  packed["m2"] = pack_transaction(b);
  packed["m3"] = pack_transaction(c);
  return packed;
}

void check_edge(const TraceEdge &edge, td::Slice left, td::Slice right, td::Slice msg_hash) {
  ASSERT_STREQ(edge.left_tx, left);
  ASSERT_STREQ(edge.right_tx, right);
  ASSERT_STREQ(edge.msg_hash, msg_hash);
}

}  // namespace

TEST(PhaseDecoder, status_change_codes) {
  ASSERT_TRUE(parse_status_change(0).move_as_ok() == AccStatusChange::unchanged);
  ASSERT_TRUE(parse_status_change(1).move_as_ok() == AccStatusChange::frozen);
  ASSERT_TRUE(parse_status_change(2).move_as_ok() == AccStatusChange::deleted);
  for (td::int64 code : {-1, 3, 255}) {
    auto r = parse_status_change(code);
    ASSERT_TRUE(r.is_error());
    ASSERT_EQ(r.error().code(), ErrorCode::decode_error);
  }
}

TEST(TransactionDecoder, account_status_codes) {
  ASSERT_TRUE(parse_account_status(0).move_as_ok() == AccountStatus::uninit);
  ASSERT_TRUE(parse_account_status(1).move_as_ok() == AccountStatus::frozen);
  ASSERT_TRUE(parse_account_status(2).move_as_ok() == AccountStatus::active);
  ASSERT_TRUE(parse_account_status(3).move_as_ok() == AccountStatus::nonexist);
  ASSERT_EQ(parse_account_status(4).error().code(), ErrorCode::decode_error);
}

TEST(PhaseDecoder, compute_skipped) {
  auto h = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(0);
    pk.pack_array(1);
    pk.pack(2);
  });
  auto r = parse_tr_compute_phase(h.get());
  ASSERT_TRUE(r.is_ok());
  auto compute = r.move_as_ok();
  ASSERT_TRUE(std::holds_alternative<TrComputePhase_skipped>(compute));
  ASSERT_TRUE(std::get<TrComputePhase_skipped>(compute).reason == ComputeSkipReason::no_gas);

  auto bad = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(0);
    pk.pack_array(1);
    pk.pack(7);
  });
  ASSERT_EQ(parse_tr_compute_phase(bad.get()).error().code(), ErrorCode::decode_error);
}

TEST(PhaseDecoder, compute_vm) {
  auto h = pack_object([](Packer &pk) { test::pack_vm_compute_phase(pk); });
  auto compute = parse_tr_compute_phase(h.get()).move_as_ok();
  ASSERT_TRUE(std::holds_alternative<TrComputePhase_vm>(compute));
  const auto &vm = std::get<TrComputePhase_vm>(compute);
  ASSERT_TRUE(vm.success);
  ASSERT_EQ(vm.gas_fees, 1537600u);
  ASSERT_EQ(vm.gas_used, 3844u);
  ASSERT_TRUE(!vm.gas_credit);
  ASSERT_TRUE(!vm.exit_arg);
  ASSERT_EQ(vm.vm_steps, 68u);
  ASSERT_EQ(vm.vm_final_state_hash, "vm_final_state_hash");
}

TEST(PhaseDecoder, arity_mismatch) {
  auto h = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(1);
    pk.pack_array(12);
    for (int i = 0; i < 12; i++) {
      pk.pack(0);
    }
  });
  auto r = parse_tr_compute_phase(h.get());
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::decode_error);

  auto storage = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(1);
    pk.pack(0);
  });
  ASSERT_TRUE(parse_tr_storage_phase(storage.get()).is_error());

  auto unknown_tag = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(5);
    pk.pack_array(0);
  });
  ASSERT_TRUE(parse_tr_compute_phase(unknown_tag.get()).is_error());
}

TEST(PhaseDecoder, wrong_field_type) {
  auto h = pack_object([](Packer &pk) {
    pk.pack_array(3);
    pk.pack(std::string("100"));
    pk.pack_nil();
    pk.pack(0);
  });
  auto r = parse_tr_storage_phase(h.get());
  ASSERT_TRUE(r.is_error());
  ASSERT_TRUE(r.error().message().str().find("storage_fees_collected") != std::string::npos);
}

TEST(PhaseDecoder, action_phase) {
  auto h = pack_object([](Packer &pk) { test::pack_action_phase(pk); });
  auto action = parse_tr_action_phase(h.get()).move_as_ok();
  ASSERT_TRUE(action.success);
  ASSERT_TRUE(action.status_change == AccStatusChange::unchanged);
  ASSERT_EQ(action.total_fwd_fees.value(), 1000000u);
  ASSERT_TRUE(!action.result_arg);
  ASSERT_EQ(action.msgs_created, 1u);
  ASSERT_EQ(action.tot_msg_size.cells, 1u);
  ASSERT_EQ(action.tot_msg_size.bits, 705u);
}

TEST(PhaseDecoder, bounce_phase) {
  auto negfunds = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(0);
    pk.pack_array(0);
  });
  ASSERT_TRUE(std::holds_alternative<TrBouncePhase_negfunds>(parse_tr_bounce_phase(negfunds.get()).move_as_ok()));

  auto nofunds = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(1);
    pk.pack_array(2);
    test::pack_storage_used(pk, 2, 600);
    pk.pack(td::uint64{12345});
  });
  auto nofunds_phase = std::get<TrBouncePhase_nofunds>(parse_tr_bounce_phase(nofunds.get()).move_as_ok());
  ASSERT_EQ(nofunds_phase.msg_size.cells, 2u);
  ASSERT_EQ(nofunds_phase.req_fwd_fees, 12345u);

  auto ok = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(2);
    pk.pack_array(3);
    test::pack_storage_used(pk, 1, 100);
    pk.pack(td::uint64{10});
    pk.pack(td::uint64{20});
  });
  auto ok_phase = std::get<TrBouncePhase_ok>(parse_tr_bounce_phase(ok.get()).move_as_ok());
  ASSERT_EQ(ok_phase.msg_fees, 10u);
  ASSERT_EQ(ok_phase.fwd_fees, 20u);

  auto unknown = pack_object([](Packer &pk) {
    pk.pack_array(2);
    pk.pack(3);
    pk.pack_nil();
  });
  ASSERT_TRUE(parse_tr_bounce_phase(unknown.get()).is_error());
}

TEST(PhaseDecoder, description_without_action_phase) {
  auto h = pack_object([](Packer &pk) {
    pk.pack_array(8);
    pk.pack_true();
    pk.pack_array(3);
    pk.pack(1);
    pk.pack(2);
    pk.pack(1);
    pk.pack_array(2);
    pk.pack(3);
    pk.pack(4);
    pk.pack_array(2);
    pk.pack(0);
    pk.pack_array(1);
    pk.pack(0);
    pk.pack_nil();
    pk.pack_true();
    pk.pack_nil();
    pk.pack_false();
  });
  auto descr = parse_transaction_descr(h.get()).move_as_ok();
  ASSERT_TRUE(descr.credit_first);
  ASSERT_EQ(descr.storage_ph.storage_fees_due.value(), 2u);
  ASSERT_TRUE(descr.storage_ph.status_change == AccStatusChange::frozen);
  ASSERT_EQ(descr.credit_ph.due_fees_collected.value(), 3u);
  ASSERT_EQ(descr.credit_ph.credit, 4u);
  ASSERT_TRUE(std::get<TrComputePhase_skipped>(descr.compute_ph).reason == ComputeSkipReason::no_state);
  ASSERT_TRUE(!descr.action);
  ASSERT_TRUE(descr.aborted);
  ASSERT_TRUE(!descr.bounce);
}

TEST(TransactionDecoder, simple) {
  TestTransaction t{"tx_root", kWallet, 47000000000002, external_in("ext_in")};
  t.out_msgs = {internal("m1", kWallet, kReceiver, 1000000000), internal("m2", kWallet, kReceiver, 5)};
  t.emulated = true;
  auto r = decode_transaction(pack_transaction(t));
  ASSERT_TRUE(r.is_ok());
  auto tx = r.move_as_ok();
  ASSERT_EQ(tx.hash, "tx_root");
  ASSERT_EQ(tx.account, kWallet);
  ASSERT_EQ(tx.lt, 47000000000002u);
  ASSERT_TRUE(tx.emulated);
  ASSERT_TRUE(tx.orig_status == AccountStatus::active);
  ASSERT_EQ(tx.total_fees, 2359093u);
  ASSERT_TRUE(tx.description.action.has_value());

  ASSERT_EQ(tx.messages.size(), 3u);
  ASSERT_EQ(tx.out_msgs_count(), 2u);
  ASSERT_EQ(tx.messages[0].msg_hash, "m1");
  ASSERT_TRUE(tx.messages[0].direction == MessageDirection::out);
  ASSERT_EQ(tx.messages[1].msg_hash, "m2");
  ASSERT_TRUE(tx.messages[1].direction == MessageDirection::out);
  ASSERT_EQ(tx.in_msg().msg_hash, "ext_in");
  ASSERT_TRUE(tx.in_msg().direction == MessageDirection::in);
  ASSERT_TRUE(!tx.in_msg().source);
  ASSERT_TRUE(!tx.in_msg().value);
  ASSERT_EQ(tx.messages[0].value.value(), 1000000000u);
  ASSERT_EQ(tx.messages[0].destination.value(), kReceiver);
  for (const auto &msg : tx.messages) {
    ASSERT_EQ(msg.tx_hash, "tx_root");
    ASSERT_EQ(msg.tx_lt, 47000000000002u);
  }
}

TEST(TransactionDecoder, unsigned_opcode) {
  TestTransaction t{"tx", kWallet, 1, external_in("in")};
  auto jetton = internal("m", kWallet, kReceiver, 1);
  jetton.opcode = 0xf8a7ea5;
  auto negative = internal("n", kWallet, kReceiver, 1);
  negative.opcode = 0xffffffffLL;
  t.out_msgs = {jetton, negative};
  auto tx = decode_transaction(pack_transaction(t)).move_as_ok();
  ASSERT_EQ(tx.messages[0].opcode.value(), 0xf8a7ea5);
  ASSERT_EQ(tx.messages[1].opcode.value(), -1);

  auto too_large = internal("x", kWallet, kReceiver, 1);
  too_large.opcode = 0x100000000LL;
  t.out_msgs = {too_large};
  ASSERT_TRUE(decode_transaction(pack_transaction(t)).is_error());
}

TEST(TransactionDecoder, binary_hashes) {
  std::string hash(32, '\xab');
  std::string msg_hash(32, '\x01');
  auto pack_record = [&](int orig_status) {
    msgpack::sbuffer buffer;
    Packer pk(buffer);
    pk.pack_array(2);
    pk.pack_array(14);
    pk.pack_bin(static_cast<td::uint32>(hash.size()));
    pk.pack_bin_body(hash.data(), static_cast<td::uint32>(hash.size()));
    pk.pack(kWallet);
    pk.pack(1);
    pk.pack(std::string("prev"));
    pk.pack(0);
    pk.pack(0);
    pk.pack(orig_status);
    pk.pack(3);
    test::pack_message(pk, external_in("in"));
    pk.pack_array(1);
    pk.pack_array(15);
    pk.pack_bin(static_cast<td::uint32>(msg_hash.size()));
    pk.pack_bin_body(msg_hash.data(), static_cast<td::uint32>(msg_hash.size()));
    for (int i = 0; i < 14; i++) {
      if (i == 8 || i == 9 || i == 10) {
        pk.pack_false();
      } else if (i == 12) {
        pk.pack(std::string("body"));
      } else {
        pk.pack_nil();
      }
    }
    pk.pack(0);
    pk.pack(std::string("a"));
    pk.pack(std::string("b"));
    test::pack_description(pk);
    pk.pack_false();
    return std::string(buffer.data(), buffer.size());
  };

  auto tx = decode_transaction(pack_record(0)).move_as_ok();
  ASSERT_EQ(tx.hash, td::hex_encode(hash));
  ASSERT_TRUE(tx.orig_status == AccountStatus::uninit);
  ASSERT_TRUE(tx.end_status == AccountStatus::nonexist);
  ASSERT_EQ(tx.messages.size(), 2u);
  ASSERT_EQ(tx.messages[0].msg_hash, td::hex_encode(msg_hash));
  for (const auto &msg : tx.messages) {
    ASSERT_EQ(msg.tx_hash, td::hex_encode(hash));
  }

  auto bad = decode_transaction(pack_record(9));
  ASSERT_TRUE(bad.is_error());
  ASSERT_TRUE(bad.error().message().str().find("transaction " + td::hex_encode(hash)) != std::string::npos);
}

TEST(TransactionDecoder, message_contents) {
  TestTransaction t{"tx_deploy", kWallet, 5, external_in("ext_in")};
  t.in_msg.body = "te6cckEBAQEAAgAAAEysuc0=";
  t.in_msg.init_state = "te6cckEBAgEAEwACATQBAQAAABQAAAAAAAAAAHbZ";
  auto plain = internal("m1", kWallet, kReceiver, 1);
  plain.body = "te6cckEBAQEABgAACAAAAAGTHU8i";
  t.out_msgs = {plain};

  auto tx = decode_transaction(pack_transaction(t)).move_as_ok();
  ASSERT_EQ(tx.messages[0].body_boc, "te6cckEBAQEABgAACAAAAAGTHU8i");
  ASSERT_TRUE(!tx.messages[0].init_state_boc);
  ASSERT_EQ(tx.in_msg().body_boc, "te6cckEBAQEAAgAAAEysuc0=");
  ASSERT_TRUE(tx.in_msg().init_state_boc.has_value());
  ASSERT_EQ(tx.in_msg().init_state_boc.value(), "te6cckEBAgEAEwACATQBAQAAABQAAAAAAAAAAHbZ");

  auto wrong_type = test::pack_object([](Packer &pk) {
    pk.pack_array(15);
    pk.pack(std::string("m"));
    for (int i = 1; i < 14; i++) {
      if (i == 9 || i == 10 || i == 11) {
        pk.pack_false();
      } else if (i == 13) {
        pk.pack(std::string("body"));
      } else {
        pk.pack_nil();
      }
    }
    pk.pack(42);
  });
  auto r = parse_message(wrong_type.get(), "tx", 1, MessageDirection::out);
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::decode_error);
  ASSERT_TRUE(r.error().message().str().find("init_state") != std::string::npos);
}

TEST(TransactionDecoder, malformed_input) {
  TestTransaction t{"tx_bad", kWallet, 1, external_in("in")};
  auto data = pack_transaction(t);

  auto trailing = decode_transaction(data + "x");
  ASSERT_TRUE(trailing.is_error());
  ASSERT_EQ(trailing.error().code(), ErrorCode::decode_error);

  auto truncated = decode_transaction(td::Slice(data).substr(0, data.size() / 2));
  ASSERT_TRUE(truncated.is_error());
  ASSERT_EQ(truncated.error().code(), ErrorCode::decode_error);

  auto empty = decode_transaction(td::Slice());
  ASSERT_TRUE(empty.is_error());

  t.orig_status = 9;
  auto bad_status = decode_transaction(pack_transaction(t));
  ASSERT_TRUE(bad_status.is_error());
  ASSERT_EQ(bad_status.error().code(), ErrorCode::decode_error);
  ASSERT_TRUE(bad_status.error().message().str().find("transaction tx_bad") != std::string::npos);
}

TEST(TraceAssembler, simple_transfer) {
  TestTransaction a{"tx_a", kWallet, 10, external_in("ext")};
  a.out_msgs = {internal("m1", kWallet, kReceiver, 1000000000)};
  TestTransaction b{"tx_b", kReceiver, 11, internal("m1", kWallet, kReceiver, 1000000000)};
  PackedTransactions packed{{"tx_a", pack_transaction(a)}, {"m1", pack_transaction(b)}};

  auto r = TraceAssembler().assemble("tx_a", packed);
  ASSERT_TRUE(r.is_ok());
  auto trace = r.move_as_ok();
  ASSERT_EQ(trace.trace_id, "tx_a");
  ASSERT_TRUE(trace.state == TraceState::complete);
  ASSERT_TRUE(trace.classification_state == ClassificationState::unclassified);
  ASSERT_EQ(trace.transactions.size(), 2u);
  ASSERT_EQ(trace.transactions[0].hash, "tx_a");
  ASSERT_EQ(trace.transactions[1].hash, "tx_b");
  ASSERT_EQ(trace.edges.size(), 1u);
  check_edge(trace.edges[0], "tx_a", "tx_b", "m1");
  ASSERT_EQ(trace.edges[0].trace_id, "tx_a");
}

TEST(TraceAssembler, depth_first_order) {
  auto trace = TraceAssembler().assemble("tx_root", branching_trace()).move_as_ok();
  ASSERT_EQ(trace.transactions.size(), 4u);
  ASSERT_EQ(trace.transactions[0].hash, "tx_root");
  ASSERT_EQ(trace.transactions[1].hash, "tx_a");
  ASSERT_EQ(trace.transactions[2].hash, "tx_c");
  ASSERT_EQ(trace.transactions[3].hash, "tx_b");
  ASSERT_EQ(trace.edges.size(), 3u);
  check_edge(trace.edges[0], "tx_root", "tx_a", "m1");
  check_edge(trace.edges[1], "tx_a", "tx_c", "m3");
  check_edge(trace.edges[2], "tx_root", "tx_b", "m2");
}

TEST(TraceAssembler, edge_completeness) {
  auto trace = TraceAssembler().assemble("tx_root", branching_trace()).move_as_ok();
  size_t out_msgs = 0;
  for (const auto &tx : trace.transactions) {
    out_msgs += tx.out_msgs_count();
  }
  ASSERT_EQ(trace.edges.size(), out_msgs);

  std::map<std::string, int> incoming;
  for (const auto &edge : trace.edges) {
    incoming[edge.right_tx]++;
  }
  ASSERT_EQ(incoming.count("tx_root"), 0u);
  for (size_t i = 1; i < trace.transactions.size(); i++) {
    ASSERT_EQ(incoming[trace.transactions[i].hash], 1);
  }
}

TEST(TraceAssembler, missing_child) {
  auto packed = branching_trace();
  packed.erase("m3");
  auto r = TraceAssembler().assemble("tx_root", packed);
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::missing_transaction);
  auto message = r.error().message().str();
  ASSERT_TRUE(message.find("m3") != std::string::npos);
  ASSERT_TRUE(message.find("tx_a") != std::string::npos);
}

TEST(TraceAssembler, missing_root) {
  auto r = TraceAssembler().assemble("unknown", branching_trace());
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::missing_transaction);
}

TEST(TraceAssembler, malformed_child) {
  auto packed = branching_trace();
  packed["m2"] = "\xc1";
  auto r = TraceAssembler().assemble("tx_root", packed);
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::decode_error);
  auto message = r.error().message().str();
  ASSERT_TRUE(message.find("transaction for message m2, parent tx_root: ") != std::string::npos);
}

TEST(TraceAssembler, transaction_budget) {
  auto packed = branching_trace();
  auto r = TraceAssembler(TraceAssembler::Options{3}).assemble("tx_root", packed);
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::trace_too_large);

  ASSERT_TRUE(TraceAssembler(TraceAssembler::Options{4}).assemble("tx_root", packed).is_ok());
}

TEST(TraceAssembler, cycle) {
  TestTransaction a{"tx_a", kWallet, 10, external_in("ext")};
  a.out_msgs = {internal("loop", kWallet, kWallet, 1)};
  PackedTransactions packed{{"tx_a", pack_transaction(a)}, {"loop", pack_transaction(a)}};
  auto r = TraceAssembler().assemble("tx_a", packed);
  ASSERT_TRUE(r.is_error());
  ASSERT_EQ(r.error().code(), ErrorCode::trace_too_large);
}

TEST(TraceAssembler, long_chain) {
  const int depth = 20000;
  PackedTransactions packed;
  for (int i = 0; i < depth; i++) {
    auto hash = PSTRING() << "tx" << i;
    TestTransaction t{hash, kWallet, static_cast<td::uint64>(i + 1),
                      i == 0 ? external_in("ext") : internal(PSTRING() << "m" << i, kWallet, kWallet, 1)};
    if (i + 1 < depth) {
      t.out_msgs = {internal(PSTRING() << "m" << i + 1, kWallet, kWallet, 1)};
    }
    packed[i == 0 ? hash : PSTRING() << "m" << i] = pack_transaction(t);
  }
  auto trace = TraceAssembler().assemble("tx0", packed).move_as_ok();
  ASSERT_EQ(trace.transactions.size(), static_cast<size_t>(depth));
  ASSERT_EQ(trace.edges.size(), static_cast<size_t>(depth - 1));
  ASSERT_EQ(trace.transactions.back().hash, PSTRING() << "tx" << depth - 1);
}

TEST(TraceJson, trace) {
  auto trace = TraceAssembler().assemble("tx_root", branching_trace()).move_as_ok();
  auto json = to_json(trace);
  ASSERT_TRUE(json.find("\"trace_id\":\"tx_root\"") != std::string::npos);
  ASSERT_TRUE(json.find("\"state\":\"complete\"") != std::string::npos);
  ASSERT_TRUE(json.find("\"classification_state\":\"unclassified\"") != std::string::npos);
  ASSERT_TRUE(json.find("\"left_tx\":\"tx_a\"") != std::string::npos);
  ASSERT_TRUE(json.find("\"gas_fees\":\"1537600\"") != std::string::npos);
  ASSERT_TRUE(json.find("\"bounce\":null") != std::string::npos);
}
