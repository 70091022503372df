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
#include "common/refint.h"

#include <optional>
#include <string>
#include <vector>

namespace indexer {

struct TonTransferData {
  std::optional<std::string> content;
  bool encrypted{false};
};

struct JettonTransferData {
  td::RefInt256 query_id;
  std::optional<std::string> response_destination;
  td::RefInt256 forward_amount;
  std::optional<std::string> custom_payload;
  std::optional<std::string> forward_payload;
  std::optional<std::string> comment;
  bool is_encrypted_comment{false};
};

struct NftTransferData {
  td::RefInt256 query_id;
  bool is_purchase{false};
  std::optional<td::RefInt256> price;
  td::RefInt256 nft_item_index;
  std::optional<td::RefInt256> forward_amount;
  std::optional<std::string> custom_payload;
  std::optional<std::string> forward_payload;
  std::optional<std::string> response_destination;
};

struct NftMintData {
  td::RefInt256 nft_item_index;
};

struct JettonSwapTransferData {
  td::RefInt256 amount;
  std::optional<std::string> source;
  std::optional<std::string> source_jetton_wallet;
  std::optional<std::string> destination;
  std::optional<std::string> destination_jetton_wallet;
  std::optional<std::string> asset;
};

struct JettonSwapData {
  std::string dex;
  std::optional<std::string> sender;
  JettonSwapTransferData dex_incoming_transfer;
  JettonSwapTransferData dex_outgoing_transfer;
};

// Shared by change_dns and delete_dns; the latter only carries the key.
struct ChangeDnsRecordData {
  std::optional<std::string> value_schema;
  std::optional<td::int32> flags;
  std::optional<std::string> address;
  std::string key;
  std::optional<std::string> dns_text;
};

// Fields common to every action, derived from the block itself.
struct ActionBase {
  std::string trace_id;
  std::string type;
  std::string action_id;
  // sorted, no duplicates
  std::vector<std::string> tx_hashes;
  td::uint64 start_lt{0};
  td::uint64 end_lt{0};
  td::uint32 start_utime{0};
  td::uint32 end_utime{0};
  bool success{false};
};

// Fields filled by the extractor of a particular block type.
struct ActionFields {
  std::optional<std::string> source;
  std::optional<std::string> source_secondary;
  std::optional<std::string> destination;
  std::optional<std::string> destination_secondary;
  std::optional<td::RefInt256> value;
  std::optional<td::RefInt256> amount;
  std::optional<std::string> asset;
  std::optional<std::string> asset2;
  std::optional<std::string> asset_secondary;
  std::optional<td::int32> opcode;

  std::optional<TonTransferData> ton_transfer_data;
  std::optional<JettonTransferData> jetton_transfer_data;
  std::optional<NftTransferData> nft_transfer_data;
  std::optional<NftMintData> nft_mint_data;
  std::optional<JettonSwapData> jetton_swap_data;
  std::optional<ChangeDnsRecordData> change_dns_record_data;
};

struct Action : ActionBase, ActionFields {};

}  // namespace indexer
