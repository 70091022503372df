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
#include "td/utils/Slice.h"
#include "common/refint.h"

#include "address.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace indexer {

struct BlockValue;

// Loosely-typed payload of a classified block, keyed by field name.
using BlockData = std::map<std::string, BlockValue>;

struct BlockValue {
  // std::string holds both text and raw bytes, the reading side knows which one a key carries.
  using Value = std::variant<std::monostate, bool, td::int64, td::RefInt256, std::string, block::StdAddress, Asset,
                             std::shared_ptr<const BlockData>>;
  Value value;

  BlockValue() = default;
  BlockValue(std::nullptr_t) {
  }
  BlockValue(bool x) : value(x) {
  }
  BlockValue(int x) : value(static_cast<td::int64>(x)) {
  }
  BlockValue(td::int64 x) : value(x) {
  }
  BlockValue(td::RefInt256 x) : value(std::move(x)) {
  }
  BlockValue(std::string x) : value(std::move(x)) {
  }
  BlockValue(const char *x) : value(std::string(x)) {
  }
  BlockValue(block::StdAddress x) : value(std::move(x)) {
  }
  BlockValue(Asset x) : value(std::move(x)) {
  }
  BlockValue(BlockData x) : value(std::make_shared<const BlockData>(std::move(x))) {
  }

  bool is_null() const {
    return std::holds_alternative<std::monostate>(value);
  }
  td::Slice type_name() const;
};

struct EventNode {
  td::uint64 lt{0};
  std::string tx_hash;
  std::optional<std::string> message_hash;
};

// Output of the external classifier: one higher-level operation over a trace.
struct Block {
  std::string btype;
  std::vector<EventNode> event_nodes;
  bool failed{false};
  td::uint64 min_lt{0};
  td::uint64 max_lt{0};
  td::uint32 min_utime{0};
  td::uint32 max_utime{0};
  BlockData data;
};

}  // namespace indexer
