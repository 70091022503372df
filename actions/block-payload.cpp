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
#include "block-payload.h"

#include "common/indexer-errorcode.h"
#include "td/utils/logging.h"

#include <limits>

namespace indexer {

namespace {

// Typed view over a BlockData map. Nested maps are read through a child reader
// whose field names are prefixed with the parent key.
class PayloadReader {
 public:
  PayloadReader(td::Slice btype, const BlockData &data, std::string prefix = {})
      : btype_(btype), data_(&data), prefix_(std::move(prefix)) {
  }

  template <class T>
  td::Result<T> get(td::Slice key) const {
    TRY_RESULT(value, get_optional<T>(key));
    if (!value) {
      return missing(key);
    }
    return std::move(value.value());
  }

  template <class T>
  td::Result<std::optional<T>> get_optional(td::Slice key) const {
    auto it = data_->find(key.str());
    if (it == data_->end() || it->second.is_null()) {
      return std::optional<T>();
    }
    T res;
    TRY_STATUS(read_value(key, it->second, res));
    return std::optional<T>(std::move(res));
  }

  td::Result<std::optional<PayloadReader>> get_optional_map(td::Slice key) const {
    auto it = data_->find(key.str());
    if (it == data_->end() || it->second.is_null()) {
      return std::optional<PayloadReader>();
    }
    auto nested = std::get_if<std::shared_ptr<const BlockData>>(&it->second.value);
    if (nested == nullptr || !*nested) {
      return wrong_type(key, it->second, "map");
    }
    return std::optional<PayloadReader>(PayloadReader(btype_, **nested, PSTRING() << prefix_ << key << "."));
  }

  td::Result<PayloadReader> get_map(td::Slice key) const {
    TRY_RESULT(value, get_optional_map(key));
    if (!value) {
      return missing(key);
    }
    return std::move(value.value());
  }

  td::Slice btype() const {
    return btype_;
  }

  td::Status missing(td::Slice key) const {
    return td::Status::Error(ErrorCode::missing_required_field,
                             PSLICE() << btype_ << ": missing required field '" << prefix_ << key << "'");
  }

 private:
  td::Slice btype_;
  const BlockData *data_;
  std::string prefix_;

  td::Status wrong_type(td::Slice key, const BlockValue &value, td::Slice expected) const {
    return td::Status::Error(ErrorCode::decode_error, PSLICE() << btype_ << ": field '" << prefix_ << key << "' is "
                                                               << value.type_name() << ", expected " << expected);
  }

  td::Status read_value(td::Slice key, const BlockValue &value, bool &res) const {
    auto x = std::get_if<bool>(&value.value);
    if (x == nullptr) {
      return wrong_type(key, value, "bool");
    }
    res = *x;
    return td::Status::OK();
  }

  // 32-bit tags (opcodes, flags) may arrive signed or unsigned.
  td::Status read_value(td::Slice key, const BlockValue &value, td::int32 &res) const {
    auto x = std::get_if<td::int64>(&value.value);
    if (x == nullptr) {
      return wrong_type(key, value, "integer");
    }
    if (*x < std::numeric_limits<td::int32>::min() || *x > std::numeric_limits<td::uint32>::max()) {
      return td::Status::Error(ErrorCode::decode_error, PSLICE() << btype_ << ": field '" << prefix_ << key
                                                                 << "' value " << *x << " does not fit 32 bits");
    }
    res = static_cast<td::int32>(static_cast<td::uint32>(*x));
    return td::Status::OK();
  }

  td::Status read_value(td::Slice key, const BlockValue &value, td::RefInt256 &res) const {
    if (auto x = std::get_if<td::int64>(&value.value)) {
      res = td::make_refint(*x);
      return td::Status::OK();
    }
    auto x = std::get_if<td::RefInt256>(&value.value);
    if (x == nullptr || x->is_null() || !(*x)->is_valid()) {
      return wrong_type(key, value, "integer");
    }
    res = *x;
    return td::Status::OK();
  }

  td::Status read_value(td::Slice key, const BlockValue &value, std::string &res) const {
    auto x = std::get_if<std::string>(&value.value);
    if (x == nullptr) {
      return wrong_type(key, value, "string");
    }
    res = *x;
    return td::Status::OK();
  }

  td::Status read_value(td::Slice key, const BlockValue &value, block::StdAddress &res) const {
    auto x = std::get_if<block::StdAddress>(&value.value);
    if (x == nullptr || !x->is_valid()) {
      return wrong_type(key, value, "address");
    }
    res = *x;
    return td::Status::OK();
  }

  td::Status read_value(td::Slice key, const BlockValue &value, Asset &res) const {
    auto x = std::get_if<Asset>(&value.value);
    if (x == nullptr) {
      return wrong_type(key, value, "asset");
    }
    res = *x;
    return td::Status::OK();
  }
};

td::Result<CallContractPayload> parse_call_contract(const PayloadReader &r) {
  CallContractPayload p;
  TRY_RESULT_ASSIGN(p.opcode, r.get<td::int32>("opcode"));
  TRY_RESULT_ASSIGN(p.value, r.get<td::RefInt256>("value"));
  TRY_RESULT_ASSIGN(p.source, r.get_optional<block::StdAddress>("source"));
  TRY_RESULT_ASSIGN(p.destination, r.get_optional<block::StdAddress>("destination"));
  return p;
}

td::Result<TonTransferPayload> parse_ton_transfer(const PayloadReader &r) {
  TonTransferPayload p;
  TRY_RESULT_ASSIGN(p.value, r.get<td::RefInt256>("value"));
  TRY_RESULT_ASSIGN(p.source, r.get<block::StdAddress>("source"));
  TRY_RESULT_ASSIGN(p.destination, r.get_optional<block::StdAddress>("destination"));
  TRY_RESULT_ASSIGN(p.comment, r.get_optional<std::string>("comment"));
  TRY_RESULT_ASSIGN(p.encrypted, r.get<bool>("encrypted"));
  return p;
}

td::Result<JettonTransferPayload> parse_jetton_transfer(const PayloadReader &r) {
  JettonTransferPayload p;
  TRY_RESULT_ASSIGN(p.sender, r.get<block::StdAddress>("sender"));
  TRY_RESULT_ASSIGN(p.sender_wallet, r.get<block::StdAddress>("sender_wallet"));
  TRY_RESULT_ASSIGN(p.receiver, r.get<block::StdAddress>("receiver"));
  TRY_RESULT_ASSIGN(p.receiver_wallet, r.get_optional<block::StdAddress>("receiver_wallet"));
  TRY_RESULT_ASSIGN(p.amount, r.get<td::RefInt256>("amount"));
  TRY_RESULT_ASSIGN(p.asset, r.get_optional<Asset>("asset"));
  TRY_RESULT_ASSIGN(p.query_id, r.get<td::RefInt256>("query_id"));
  TRY_RESULT_ASSIGN(p.response_address, r.get_optional<block::StdAddress>("response_address"));
  TRY_RESULT_ASSIGN(p.forward_amount, r.get<td::RefInt256>("forward_amount"));
  TRY_RESULT_ASSIGN(p.custom_payload, r.get_optional<std::string>("custom_payload"));
  TRY_RESULT_ASSIGN(p.forward_payload, r.get_optional<std::string>("forward_payload"));
  TRY_RESULT_ASSIGN(p.comment, r.get_optional<std::string>("comment"));
  TRY_RESULT_ASSIGN(p.encrypted_comment, r.get<bool>("encrypted_comment"));
  return p;
}

td::Result<NftTransferPayload> parse_nft_transfer(const PayloadReader &r) {
  NftTransferPayload p;
  TRY_RESULT_ASSIGN(p.prev_owner, r.get_optional<block::StdAddress>("prev_owner"));
  TRY_RESULT_ASSIGN(p.new_owner, r.get<block::StdAddress>("new_owner"));
  TRY_RESULT(nft, r.get_map("nft"));
  TRY_RESULT_ASSIGN(p.nft_address, nft.get<block::StdAddress>("address"));
  TRY_RESULT_ASSIGN(p.nft_index, nft.get<td::RefInt256>("index"));
  TRY_RESULT(collection, nft.get_optional_map("collection"));
  if (collection) {
    TRY_RESULT_ASSIGN(p.collection_address, collection->get<block::StdAddress>("address"));
  }
  TRY_RESULT_ASSIGN(p.query_id, r.get<td::RefInt256>("query_id"));
  TRY_RESULT_ASSIGN(p.is_purchase, r.get<bool>("is_purchase"));
  if (p.is_purchase) {
    TRY_RESULT_ASSIGN(p.price, r.get_optional<td::RefInt256>("price"));
  }
  TRY_RESULT_ASSIGN(p.forward_amount, r.get_optional<td::RefInt256>("forward_amount"));
  TRY_RESULT_ASSIGN(p.custom_payload, r.get_optional<std::string>("custom_payload"));
  TRY_RESULT_ASSIGN(p.forward_payload, r.get_optional<std::string>("forward_payload"));
  TRY_RESULT_ASSIGN(p.response_destination, r.get_optional<block::StdAddress>("response_destination"));
  return p;
}

td::Result<NftMintPayload> parse_nft_mint(const PayloadReader &r) {
  NftMintPayload p;
  TRY_RESULT_ASSIGN(p.source, r.get_optional<block::StdAddress>("source"));
  TRY_RESULT_ASSIGN(p.address, r.get<block::StdAddress>("address"));
  TRY_RESULT_ASSIGN(p.collection, r.get_optional<block::StdAddress>("collection"));
  TRY_RESULT_ASSIGN(p.index, r.get<td::RefInt256>("index"));
  return p;
}

td::Result<JettonBurnPayload> parse_jetton_burn(const PayloadReader &r) {
  JettonBurnPayload p;
  TRY_RESULT_ASSIGN(p.owner, r.get<block::StdAddress>("owner"));
  TRY_RESULT_ASSIGN(p.jetton_wallet, r.get<block::StdAddress>("jetton_wallet"));
  TRY_RESULT_ASSIGN(p.asset, r.get<Asset>("asset"));
  TRY_RESULT_ASSIGN(p.amount, r.get<td::RefInt256>("amount"));
  return p;
}

td::Result<DexTransferPayload> parse_dex_transfer(const PayloadReader &r) {
  DexTransferPayload p;
  TRY_RESULT_ASSIGN(p.amount, r.get<td::RefInt256>("amount"));
  TRY_RESULT_ASSIGN(p.source, r.get_optional<block::StdAddress>("source"));
  TRY_RESULT_ASSIGN(p.source_jetton_wallet, r.get_optional<block::StdAddress>("source_jetton_wallet"));
  TRY_RESULT_ASSIGN(p.destination, r.get_optional<block::StdAddress>("destination"));
  TRY_RESULT_ASSIGN(p.destination_jetton_wallet, r.get_optional<block::StdAddress>("destination_jetton_wallet"));
  TRY_RESULT_ASSIGN(p.asset, r.get_optional<Asset>("asset"));
  return p;
}

td::Result<JettonSwapPayload> parse_jetton_swap(const PayloadReader &r) {
  JettonSwapPayload p;
  TRY_RESULT_ASSIGN(p.dex, r.get<std::string>("dex"));
  TRY_RESULT_ASSIGN(p.sender, r.get_optional<block::StdAddress>("sender"));
  TRY_RESULT(incoming, r.get_map("dex_incoming_transfer"));
  TRY_RESULT_ASSIGN(p.dex_incoming_transfer, parse_dex_transfer(incoming));
  TRY_RESULT(outgoing, r.get_map("dex_outgoing_transfer"));
  TRY_RESULT_ASSIGN(p.dex_outgoing_transfer, parse_dex_transfer(outgoing));
  return p;
}

td::Result<DnsRecordValue> parse_dns_record_value(const PayloadReader &r) {
  DnsRecordValue v;
  TRY_RESULT_ASSIGN(v.schema, r.get<std::string>("schema"));
  if (v.schema == "DNSNextResolver" || v.schema == "DNSSmcAddress") {
    TRY_RESULT_ASSIGN(v.address, r.get<block::StdAddress>("address"));
  } else if (v.schema == "DNSAdnlAddress") {
    TRY_RESULT_ASSIGN(v.adnl_address, r.get<std::string>("address"));
  }
  if (v.schema == "DNSAdnlAddress" || v.schema == "DNSSmcAddress") {
    TRY_RESULT_ASSIGN(v.flags, r.get<td::int32>("flags"));
  }
  if (v.schema == "DNSText") {
    TRY_RESULT_ASSIGN(v.dns_text, r.get<std::string>("dns_text"));
  }
  return v;
}

td::Result<ChangeDnsPayload> parse_change_dns(const PayloadReader &r) {
  ChangeDnsPayload p;
  TRY_RESULT_ASSIGN(p.source, r.get_optional<block::StdAddress>("source"));
  TRY_RESULT_ASSIGN(p.destination, r.get<block::StdAddress>("destination"));
  TRY_RESULT_ASSIGN(p.key, r.get<std::string>("key"));
  TRY_RESULT(value, r.get_map("value"));
  TRY_RESULT_ASSIGN(p.value, parse_dns_record_value(value));
  return p;
}

td::Result<DeleteDnsPayload> parse_delete_dns(const PayloadReader &r) {
  DeleteDnsPayload p;
  TRY_RESULT_ASSIGN(p.source, r.get_optional<block::StdAddress>("source"));
  TRY_RESULT_ASSIGN(p.destination, r.get<block::StdAddress>("destination"));
  TRY_RESULT_ASSIGN(p.key, r.get<std::string>("key"));
  return p;
}

td::Result<SubscribePayload> parse_subscribe(const PayloadReader &r) {
  SubscribePayload p;
  TRY_RESULT_ASSIGN(p.subscriber, r.get<block::StdAddress>("subscriber"));
  TRY_RESULT_ASSIGN(p.beneficiary, r.get_optional<block::StdAddress>("beneficiary"));
  TRY_RESULT_ASSIGN(p.subscription, r.get<block::StdAddress>("subscription"));
  TRY_RESULT_ASSIGN(p.amount, r.get<td::RefInt256>("amount"));
  return p;
}

td::Result<UnsubscribePayload> parse_unsubscribe(const PayloadReader &r) {
  UnsubscribePayload p;
  TRY_RESULT_ASSIGN(p.subscriber, r.get<block::StdAddress>("subscriber"));
  TRY_RESULT_ASSIGN(p.beneficiary, r.get_optional<block::StdAddress>("beneficiary"));
  TRY_RESULT_ASSIGN(p.subscription, r.get<block::StdAddress>("subscription"));
  return p;
}

td::Result<ElectionPayload> parse_election(const PayloadReader &r) {
  ElectionPayload p;
  TRY_RESULT_ASSIGN(p.stake_holder, r.get<block::StdAddress>("stake_holder"));
  TRY_RESULT_ASSIGN(p.amount, r.get_optional<td::RefInt256>("amount"));
  return p;
}

td::Result<AuctionBidPayload> parse_auction_bid(const PayloadReader &r) {
  AuctionBidPayload p;
  TRY_RESULT_ASSIGN(p.bidder, r.get<block::StdAddress>("bidder"));
  TRY_RESULT_ASSIGN(p.auction, r.get<block::StdAddress>("auction"));
  TRY_RESULT_ASSIGN(p.nft_address, r.get<block::StdAddress>("nft_address"));
  TRY_RESULT_ASSIGN(p.amount, r.get<td::RefInt256>("amount"));
  return p;
}

template <class T>
td::Result<BlockPayload> to_payload(td::Result<T> r) {
  TRY_RESULT(payload, std::move(r));
  return BlockPayload(std::move(payload));
}

}  // namespace

td::Result<BlockPayload> parse_block_payload(const Block &block) {
  PayloadReader r(block.btype, block.data);
  const auto &btype = block.btype;
  if (btype == "call_contract") {
    return to_payload(parse_call_contract(r));
  } else if (btype == "ton_transfer") {
    return to_payload(parse_ton_transfer(r));
  } else if (btype == "jetton_transfer") {
    return to_payload(parse_jetton_transfer(r));
  } else if (btype == "nft_transfer") {
    return to_payload(parse_nft_transfer(r));
  } else if (btype == "nft_mint") {
    return to_payload(parse_nft_mint(r));
  } else if (btype == "jetton_burn") {
    return to_payload(parse_jetton_burn(r));
  } else if (btype == "jetton_swap") {
    return to_payload(parse_jetton_swap(r));
  } else if (btype == "change_dns") {
    return to_payload(parse_change_dns(r));
  } else if (btype == "delete_dns") {
    return to_payload(parse_delete_dns(r));
  } else if (btype == "subscribe") {
    return to_payload(parse_subscribe(r));
  } else if (btype == "unsubscribe") {
    return to_payload(parse_unsubscribe(r));
  } else if (btype == "election_deposit" || btype == "election_recover") {
    return to_payload(parse_election(r));
  } else if (btype == "auction_bid") {
    return to_payload(parse_auction_bid(r));
  }
  VLOG(INDEXER_DEBUG) << "no payload extractor for block type '" << btype << "'";
  return BlockPayload();
}

}  // namespace indexer
