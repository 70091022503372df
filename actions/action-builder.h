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

#include "action.h"
#include "block-payload.h"
#include "block.h"

#include <string>
#include <vector>

namespace indexer {

// base64(sha256(key || btype)) where key is the message hash of the earliest
// event node, or its transaction hash when it has no message.
td::Result<std::string> calc_action_id(const Block &block);

td::Result<ActionBase> build_action_base(const Block &block, const std::string &trace_id);

td::Result<ActionFields> extract_action_fields(const BlockPayload &payload, const ActionBase &base);

// Unknown block types yield an action with base fields only.
td::Result<Action> block_to_action(const Block &block, const std::string &trace_id);

struct ActionBatchOptions {
  // 0 means hardware concurrency
  size_t threads = 0;
};

// One result per block, in input order; a failed block does not affect the others.
std::vector<td::Result<Action>> blocks_to_actions(const std::vector<Block> &blocks, const std::string &trace_id,
                                                  ActionBatchOptions options = {});

}  // namespace indexer
