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

#include "block.h"

#include <optional>
#include <string>
#include <variant>

namespace indexer {

// Typed payloads, one per known block type. Required members are plain values,
// optional ones are std::optional; parse_block_payload enforces the difference.

struct CallContractPayload {
  td::int32 opcode{0};
  td::RefInt256 value;
  std::optional<block::StdAddress> source;
  std::optional<block::StdAddress> destination;
};

struct TonTransferPayload {
  td::RefInt256 value;
  block::StdAddress source;
  std::optional<block::StdAddress> destination;
  std::optional<std::string> comment;
  bool encrypted{false};
};

struct JettonTransferPayload {
  block::StdAddress sender;
  block::StdAddress sender_wallet;
  block::StdAddress receiver;
  std::optional<block::StdAddress> receiver_wallet;
  td::RefInt256 amount;
  std::optional<Asset> asset;
  td::RefInt256 query_id;
  std::optional<block::StdAddress> response_address;
  td::RefInt256 forward_amount;
  std::optional<std::string> custom_payload;
  std::optional<std::string> forward_payload;
  // raw bytes, encrypted or UTF-8 text depending on encrypted_comment
  std::optional<std::string> comment;
  bool encrypted_comment{false};
};

struct NftTransferPayload {
  std::optional<block::StdAddress> prev_owner;
  block::StdAddress new_owner;
  block::StdAddress nft_address;
  std::optional<block::StdAddress> collection_address;
  td::RefInt256 nft_index;
  td::RefInt256 query_id;
  bool is_purchase{false};
  std::optional<td::RefInt256> price;
  std::optional<td::RefInt256> forward_amount;
  std::optional<std::string> custom_payload;
  std::optional<std::string> forward_payload;
  std::optional<block::StdAddress> response_destination;
};

struct NftMintPayload {
  std::optional<block::StdAddress> source;
  block::StdAddress address;
  std::optional<block::StdAddress> collection;
  td::RefInt256 index;
};

struct JettonBurnPayload {
  block::StdAddress owner;
  block::StdAddress jetton_wallet;
  Asset asset;
  td::RefInt256 amount;
};

struct DexTransferPayload {
  td::RefInt256 amount;
  std::optional<block::StdAddress> source;
  std::optional<block::StdAddress> source_jetton_wallet;
  std::optional<block::StdAddress> destination;
  std::optional<block::StdAddress> destination_jetton_wallet;
  std::optional<Asset> asset;
};

struct JettonSwapPayload {
  std::string dex;
  std::optional<block::StdAddress> sender;
  DexTransferPayload dex_incoming_transfer;
  DexTransferPayload dex_outgoing_transfer;
};

struct DnsRecordValue {
  std::string schema;
  // DNSNextResolver, DNSSmcAddress
  std::optional<block::StdAddress> address;
  // DNSAdnlAddress, raw bytes
  std::optional<std::string> adnl_address;
  // DNSAdnlAddress, DNSSmcAddress
  std::optional<td::int32> flags;
  // DNSText
  std::optional<std::string> dns_text;
};

struct ChangeDnsPayload {
  std::optional<block::StdAddress> source;
  block::StdAddress destination;
  std::string key;
  DnsRecordValue value;
};

struct DeleteDnsPayload {
  std::optional<block::StdAddress> source;
  block::StdAddress destination;
  std::string key;
};

struct SubscribePayload {
  block::StdAddress subscriber;
  std::optional<block::StdAddress> beneficiary;
  block::StdAddress subscription;
  td::RefInt256 amount;
};

struct UnsubscribePayload {
  block::StdAddress subscriber;
  std::optional<block::StdAddress> beneficiary;
  block::StdAddress subscription;
};

// election_deposit and election_recover
struct ElectionPayload {
  block::StdAddress stake_holder;
  std::optional<td::RefInt256> amount;
};

struct AuctionBidPayload {
  block::StdAddress bidder;
  block::StdAddress auction;
  block::StdAddress nft_address;
  td::RefInt256 amount;
};

// std::monostate stands for a block type without a dedicated payload.
using BlockPayload =
    std::variant<std::monostate, CallContractPayload, TonTransferPayload, JettonTransferPayload, NftTransferPayload,
                 NftMintPayload, JettonBurnPayload, JettonSwapPayload, ChangeDnsPayload, DeleteDnsPayload,
                 SubscribePayload, UnsubscribePayload, ElectionPayload, AuctionBidPayload>;

// Fails with missing_required_field when a mandatory key is absent or null and
// with decode_error when a key holds a value of the wrong kind.
td::Result<BlockPayload> parse_block_payload(const Block &block);

}  // namespace indexer
