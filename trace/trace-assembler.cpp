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
#include "trace-assembler.h"
#include "transaction-decoder.h"

#include "common/indexer-errorcode.h"
#include "td/utils/logging.h"

#include <set>

namespace indexer {

td::Result<Trace> TraceAssembler::assemble(const std::string &trace_id, const PackedTransactions &packed) const {
  Trace trace;
  trace.trace_id = trace_id;
  std::set<std::string> visited;

  auto add_transaction = [&](td::Slice data) -> td::Status {
    if (options_.max_transactions != 0 && trace.transactions.size() >= options_.max_transactions) {
      return td::Status::Error(ErrorCode::trace_too_large, PSLICE() << "trace " << trace_id << " has more than "
                                                                    << options_.max_transactions << " transactions");
    }
    TRY_RESULT(tx, decode_transaction(data));
    if (!visited.insert(tx.hash).second) {
      return td::Status::Error(ErrorCode::trace_too_large,
                               PSLICE() << "transaction " << tx.hash << " is reached twice in trace " << trace_id);
    }
    trace.transactions.push_back(std::move(tx));
    return td::Status::OK();
  };

  auto root = packed.find(trace_id);
  if (root == packed.end()) {
    return td::Status::Error(ErrorCode::missing_transaction, PSLICE() << "root transaction " << trace_id << " not found");
  }
  TRY_STATUS(add_transaction(root->second));

  // (transaction index, next message index) of every transaction whose children are not exhausted yet
  std::vector<std::pair<size_t, size_t>> stack;
  stack.emplace_back(0, 0);
  while (!stack.empty()) {
    auto &frame = stack.back();
    const auto &parent = trace.transactions[frame.first];
    if (frame.second >= parent.messages.size()) {
      stack.pop_back();
      continue;
    }
    const auto &msg = parent.messages[frame.second++];
    if (msg.direction != MessageDirection::out) {
      continue;
    }
    auto it = packed.find(msg.msg_hash);
    if (it == packed.end()) {
      return td::Status::Error(ErrorCode::missing_transaction, PSLICE() << "transaction for message " << msg.msg_hash
                                                                        << " not found, parent " << parent.hash);
    }
    // parent and msg may dangle once transactions grows
    std::string parent_hash = parent.hash;
    std::string msg_hash = msg.msg_hash;
    TRY_STATUS_PREFIX(add_transaction(it->second),
                      PSLICE() << "transaction for message " << msg_hash << ", parent " << parent_hash << ": ");
    trace.edges.push_back(TraceEdge{std::move(parent_hash), trace.transactions.back().hash, std::move(msg_hash), trace_id});
    stack.emplace_back(trace.transactions.size() - 1, 0);
  }

  trace.state = TraceState::complete;
  VLOG(INDEXER_DEBUG) << "assembled trace " << trace_id << ": " << trace.transactions.size() << " transactions, "
                      << trace.edges.size() << " edges";
  return trace;
}

}  // namespace indexer
