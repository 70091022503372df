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
#include "action-json.h"

#include "td/utils/JsonBuilder.h"

namespace indexer {

namespace {

std::string dec(const td::RefInt256 &x) {
  return x.not_null() ? x->to_dec_string() : std::string();
}

template <class ObjT>
void put(ObjT &obj, td::Slice key, const std::optional<std::string> &value) {
  if (value) {
    obj(key, value.value());
  } else {
    obj(key, td::JsonNull());
  }
}

template <class ObjT>
void put(ObjT &obj, td::Slice key, const std::optional<td::RefInt256> &value) {
  if (value && value->not_null()) {
    obj(key, dec(value.value()));
  } else {
    obj(key, td::JsonNull());
  }
}

template <class ObjT>
void put(ObjT &obj, td::Slice key, const std::optional<td::int32> &value) {
  if (value) {
    obj(key, value.value());
  } else {
    obj(key, td::JsonNull());
  }
}

std::string jsonify(const TonTransferData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  put(c, "content", data.content);
  c("encrypted", td::JsonBool(data.encrypted));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const JettonTransferData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("query_id", dec(data.query_id));
  put(c, "response_destination", data.response_destination);
  c("forward_amount", dec(data.forward_amount));
  put(c, "custom_payload", data.custom_payload);
  put(c, "forward_payload", data.forward_payload);
  put(c, "comment", data.comment);
  c("is_encrypted_comment", td::JsonBool(data.is_encrypted_comment));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const NftTransferData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("query_id", dec(data.query_id));
  c("is_purchase", td::JsonBool(data.is_purchase));
  put(c, "price", data.price);
  c("nft_item_index", dec(data.nft_item_index));
  put(c, "forward_amount", data.forward_amount);
  put(c, "custom_payload", data.custom_payload);
  put(c, "forward_payload", data.forward_payload);
  put(c, "response_destination", data.response_destination);
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const NftMintData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("nft_item_index", dec(data.nft_item_index));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const JettonSwapTransferData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("amount", dec(data.amount));
  put(c, "source", data.source);
  put(c, "source_jetton_wallet", data.source_jetton_wallet);
  put(c, "destination", data.destination);
  put(c, "destination_jetton_wallet", data.destination_jetton_wallet);
  put(c, "asset", data.asset);
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const JettonSwapData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("dex", data.dex);
  put(c, "sender", data.sender);
  c("dex_incoming_transfer", td::JsonRaw(jsonify(data.dex_incoming_transfer)));
  c("dex_outgoing_transfer", td::JsonRaw(jsonify(data.dex_outgoing_transfer)));
  c.leave();
  return jb.string_builder().as_cslice().str();
}

std::string jsonify(const ChangeDnsRecordData &data) {
  td::JsonBuilder jb;
  auto c = jb.enter_object();
  c("key", data.key);
  put(c, "value_schema", data.value_schema);
  put(c, "flags", data.flags);
  put(c, "address", data.address);
  put(c, "dns_text", data.dns_text);
  c.leave();
  return jb.string_builder().as_cslice().str();
}

template <class ObjT, class T>
void put_data(ObjT &obj, td::Slice key, const std::optional<T> &value) {
  if (value) {
    obj(key, td::JsonRaw(jsonify(value.value())));
  } else {
    obj(key, td::JsonNull());
  }
}

}  // namespace

std::string to_json(const Action &action) {
  td::JsonBuilder jb;
  auto obj = jb.enter_object();
  obj("trace_id", action.trace_id);
  obj("type", action.type);
  obj("action_id", action.action_id);
  td::JsonBuilder hashes_jb;
  auto hashes = hashes_jb.enter_array();
  for (const auto &hash : action.tx_hashes) {
    hashes << hash;
  }
  hashes.leave();
  obj("tx_hashes", td::JsonRaw(hashes_jb.string_builder().as_cslice()));
  obj("start_lt", std::to_string(action.start_lt));
  obj("end_lt", std::to_string(action.end_lt));
  obj("start_utime", static_cast<td::int64>(action.start_utime));
  obj("end_utime", static_cast<td::int64>(action.end_utime));
  obj("success", td::JsonBool(action.success));
  put(obj, "source", action.source);
  put(obj, "source_secondary", action.source_secondary);
  put(obj, "destination", action.destination);
  put(obj, "destination_secondary", action.destination_secondary);
  put(obj, "value", action.value);
  put(obj, "amount", action.amount);
  put(obj, "asset", action.asset);
  put(obj, "asset2", action.asset2);
  put(obj, "asset_secondary", action.asset_secondary);
  put(obj, "opcode", action.opcode);
  put_data(obj, "ton_transfer_data", action.ton_transfer_data);
  put_data(obj, "jetton_transfer_data", action.jetton_transfer_data);
  put_data(obj, "nft_transfer_data", action.nft_transfer_data);
  put_data(obj, "nft_mint_data", action.nft_mint_data);
  put_data(obj, "jetton_swap_data", action.jetton_swap_data);
  put_data(obj, "change_dns_record_data", action.change_dns_record_data);
  obj.leave();
  return jb.string_builder().as_cslice().str();
}

}  // namespace indexer
