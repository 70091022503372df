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
#include "action-builder.h"

#include <mutex>
#include <vector>

#include "common/bitstring.h"
#include "common/indexer-errorcode.h"
#include "common/threadpool.hpp"
#include "td/utils/algorithm.h"
#include "td/utils/base64.h"
#include "td/utils/crypto.h"
#include "td/utils/logging.h"
#include "td/utils/misc.h"
#include "td/utils/utf8.h"

#include <algorithm>
#include <functional>

namespace indexer {

namespace {

std::string remove_nul(std::string str) {
  str.erase(std::remove(str.begin(), str.end(), '\0'), str.end());
  return str;
}

JettonSwapTransferData convert_dex_transfer(const DexTransferPayload &p) {
  JettonSwapTransferData res;
  res.amount = p.amount;
  res.source = normalize_address(p.source);
  res.source_jetton_wallet = normalize_address(p.source_jetton_wallet);
  res.destination = normalize_address(p.destination);
  res.destination_jetton_wallet = normalize_address(p.destination_jetton_wallet);
  res.asset = normalize_asset(p.asset);
  return res;
}

class FieldExtractor {
 public:
  explicit FieldExtractor(const ActionBase &base) : base_(base) {
  }

  td::Result<ActionFields> operator()(const std::monostate &) const {
    return ActionFields{};
  }

  td::Result<ActionFields> operator()(const CallContractPayload &p) const {
    ActionFields f;
    f.opcode = p.opcode;
    f.value = p.value;
    f.source = normalize_address(p.source);
    f.destination = normalize_address(p.destination);
    return f;
  }

  td::Result<ActionFields> operator()(const TonTransferPayload &p) const {
    ActionFields f;
    f.value = p.value;
    f.source = address_to_raw(p.source);
    if (!p.destination) {
      LOG(ERROR) << "ton_transfer without destination in trace " << base_.trace_id << ", action " << base_.action_id;
    }
    f.destination = normalize_address(p.destination);
    TonTransferData data;
    if (p.comment) {
      data.content = remove_nul(p.comment.value());
    }
    data.encrypted = p.encrypted;
    f.ton_transfer_data = std::move(data);
    return f;
  }

  td::Result<ActionFields> operator()(const JettonTransferPayload &p) const {
    ActionFields f;
    f.source = address_to_raw(p.sender);
    f.source_secondary = address_to_raw(p.sender_wallet);
    f.destination = address_to_raw(p.receiver);
    f.destination_secondary = normalize_address(p.receiver_wallet);
    f.amount = p.amount;
    f.asset = normalize_asset(p.asset);

    JettonTransferData data;
    data.query_id = p.query_id;
    data.response_destination = normalize_address(p.response_address);
    data.forward_amount = p.forward_amount;
    data.custom_payload = p.custom_payload;
    data.forward_payload = p.forward_payload;
    if (p.comment) {
      if (p.encrypted_comment) {
        data.comment = td::base64_encode(p.comment.value());
      } else {
        if (!td::check_utf8(p.comment.value())) {
          return td::Status::Error(ErrorCode::decode_error, PSLICE() << base_.type << ": comment is not valid UTF-8");
        }
        data.comment = remove_nul(p.comment.value());
      }
    }
    data.is_encrypted_comment = p.encrypted_comment;
    f.jetton_transfer_data = std::move(data);
    return f;
  }

  td::Result<ActionFields> operator()(const NftTransferPayload &p) const {
    ActionFields f;
    f.source = normalize_address(p.prev_owner);
    f.destination = address_to_raw(p.new_owner);
    f.asset_secondary = address_to_raw(p.nft_address);
    f.asset = normalize_address(p.collection_address);

    NftTransferData data;
    data.query_id = p.query_id;
    data.is_purchase = p.is_purchase;
    if (p.is_purchase) {
      data.price = p.price;
    }
    data.nft_item_index = p.nft_index;
    data.forward_amount = p.forward_amount;
    data.custom_payload = p.custom_payload;
    data.forward_payload = p.forward_payload;
    data.response_destination = normalize_address(p.response_destination);
    f.nft_transfer_data = std::move(data);
    return f;
  }

  td::Result<ActionFields> operator()(const NftMintPayload &p) const {
    ActionFields f;
    f.source = normalize_address(p.source);
    f.destination = address_to_raw(p.address);
    f.asset_secondary = f.destination;
    f.asset = normalize_address(p.collection);
    f.nft_mint_data = NftMintData{p.index};
    return f;
  }

  td::Result<ActionFields> operator()(const JettonBurnPayload &p) const {
    ActionFields f;
    f.source = address_to_raw(p.owner);
    f.source_secondary = address_to_raw(p.jetton_wallet);
    f.asset = normalize_asset(p.asset);
    f.amount = p.amount;
    return f;
  }

  td::Result<ActionFields> operator()(const JettonSwapPayload &p) const {
    JettonSwapData data;
    data.dex = p.dex;
    data.sender = normalize_address(p.sender);
    data.dex_incoming_transfer = convert_dex_transfer(p.dex_incoming_transfer);
    data.dex_outgoing_transfer = convert_dex_transfer(p.dex_outgoing_transfer);

    ActionFields f;
    f.asset = data.dex_incoming_transfer.asset;
    f.asset2 = data.dex_outgoing_transfer.asset;
    f.source = data.dex_incoming_transfer.source;
    f.source_secondary = data.dex_incoming_transfer.source_jetton_wallet;
    f.destination = data.dex_outgoing_transfer.destination;
    f.destination_secondary = data.dex_outgoing_transfer.destination_jetton_wallet;
    f.jetton_swap_data = std::move(data);
    return f;
  }

  td::Result<ActionFields> operator()(const ChangeDnsPayload &p) const {
    ActionFields f;
    f.source = normalize_address(p.source);
    f.destination = address_to_raw(p.destination);

    ChangeDnsRecordData data;
    data.value_schema = p.value.schema;
    data.key = td::hex_encode(p.key);
    if (p.value.address) {
      data.address = address_to_raw(p.value.address.value());
    } else if (p.value.adnl_address) {
      data.address = td::hex_encode(p.value.adnl_address.value());
    }
    data.flags = p.value.flags;
    data.dns_text = p.value.dns_text;
    f.change_dns_record_data = std::move(data);
    return f;
  }

  td::Result<ActionFields> operator()(const DeleteDnsPayload &p) const {
    ActionFields f;
    f.source = normalize_address(p.source);
    f.destination = address_to_raw(p.destination);
    ChangeDnsRecordData data;
    data.key = td::hex_encode(p.key);
    f.change_dns_record_data = std::move(data);
    return f;
  }

  td::Result<ActionFields> operator()(const SubscribePayload &p) const {
    ActionFields f;
    f.source = address_to_raw(p.subscriber);
    f.destination = normalize_address(p.beneficiary);
    f.destination_secondary = address_to_raw(p.subscription);
    f.amount = p.amount;
    return f;
  }

  td::Result<ActionFields> operator()(const UnsubscribePayload &p) const {
    ActionFields f;
    f.source = address_to_raw(p.subscriber);
    f.destination = normalize_address(p.beneficiary);
    f.destination_secondary = address_to_raw(p.subscription);
    return f;
  }

  td::Result<ActionFields> operator()(const ElectionPayload &p) const {
    ActionFields f;
    f.source = address_to_raw(p.stake_holder);
    f.amount = p.amount;
    return f;
  }

  td::Result<ActionFields> operator()(const AuctionBidPayload &p) const {
    ActionFields f;
    f.source = address_to_raw(p.bidder);
    f.destination = address_to_raw(p.auction);
    f.asset_secondary = address_to_raw(p.nft_address);
    f.value = p.amount;
    return f;
  }

 private:
  const ActionBase &base_;
};

}  // namespace

td::Result<std::string> calc_action_id(const Block &block) {
  if (block.event_nodes.empty()) {
    return td::Status::Error(ErrorCode::decode_error, PSLICE() << block.btype << ": block has no event nodes");
  }
  auto root = std::min_element(block.event_nodes.begin(), block.event_nodes.end(),
                               [](const EventNode &a, const EventNode &b) { return a.lt < b.lt; });
  std::string key = root->message_hash ? root->message_hash.value() : root->tx_hash;
  key += block.btype;
  td::Bits256 digest;
  td::sha256(key, digest.as_slice());
  return td::base64_encode(digest.as_slice());
}

td::Result<ActionBase> build_action_base(const Block &block, const std::string &trace_id) {
  ActionBase base;
  TRY_RESULT_ASSIGN(base.action_id, calc_action_id(block));
  base.trace_id = trace_id;
  base.type = block.btype;
  for (const auto &node : block.event_nodes) {
    base.tx_hashes.push_back(node.tx_hash);
  }
  td::unique(base.tx_hashes);
  base.start_lt = block.min_lt;
  base.end_lt = block.max_lt;
  base.start_utime = block.min_utime;
  base.end_utime = block.max_utime;
  base.success = !block.failed;
  return base;
}

td::Result<ActionFields> extract_action_fields(const BlockPayload &payload, const ActionBase &base) {
  return std::visit(FieldExtractor(base), payload);
}

td::Result<Action> block_to_action(const Block &block, const std::string &trace_id) {
  TRY_RESULT(base, build_action_base(block, trace_id));
  TRY_RESULT_PREFIX(payload, parse_block_payload(block), PSLICE() << "action " << base.action_id << ": ");
  TRY_RESULT_PREFIX(fields, extract_action_fields(payload, base), PSLICE() << "action " << base.action_id << ": ");
  return Action{std::move(base), std::move(fields)};
}

std::vector<td::Result<Action>> blocks_to_actions(const std::vector<Block> &blocks, const std::string &trace_id,
                                                  ActionBatchOptions options) {
  std::vector<std::function<td::Result<Action>()>> tasks;
  tasks.reserve(blocks.size());
  for (const auto &block : blocks) {
    tasks.emplace_back([&block, &trace_id]() { return block_to_action(block, trace_id); });
  }
  std::vector<td::Result<Action>> results(tasks.size());
  if (tasks.empty()) {
    return results;
  }
  ton::ThreadPool::invoke_task_group(tasks.begin(), tasks.end(), results.begin(), options.threads);
  return results;
}

}  // namespace indexer
