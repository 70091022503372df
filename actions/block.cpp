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
#include "block.h"

#include "td/utils/overloaded.h"

namespace indexer {

td::Slice BlockValue::type_name() const {
  return std::visit(td::overloaded([](const std::monostate &) { return td::Slice("null"); },
                                   [](bool) { return td::Slice("bool"); },
                                   [](td::int64) { return td::Slice("integer"); },
                                   [](const td::RefInt256 &) { return td::Slice("big integer"); },
                                   [](const std::string &) { return td::Slice("string"); },
                                   [](const block::StdAddress &) { return td::Slice("address"); },
                                   [](const Asset &) { return td::Slice("asset"); },
                                   [](const std::shared_ptr<const BlockData> &) { return td::Slice("map"); }),
                    value);
}

}  // namespace indexer
