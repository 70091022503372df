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

#include "trace-types.h"

#include <map>
#include <string>

namespace indexer {

// Encoded transaction records of one trace. The root is keyed by the trace id,
// every other record by the hash of the message that created it.
using PackedTransactions = std::map<std::string, std::string>;

class TraceAssembler {
 public:
  struct Options {
    // 0 means unlimited
    size_t max_transactions = 0;
  };

  TraceAssembler() = default;
  explicit TraceAssembler(Options options) : options_(options) {
  }

  // Decodes the root record and every transaction reachable through outgoing
  // messages, depth-first in message order. Fails as a whole, never returns a partial trace.
  td::Result<Trace> assemble(const std::string &trace_id, const PackedTransactions &packed) const;

 private:
  Options options_;
};

}  // namespace indexer
