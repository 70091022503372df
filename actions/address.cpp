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
#include "address.h"

namespace indexer {

std::string address_to_raw(const block::StdAddress &addr) {
  return std::to_string(addr.workchain) + ":" + addr.addr.to_hex();
}

std::optional<std::string> normalize_address(const std::optional<block::StdAddress> &addr) {
  if (!addr || !addr->is_valid()) {
    return std::nullopt;
  }
  return address_to_raw(addr.value());
}

std::optional<std::string> normalize_asset(const std::optional<Asset> &asset) {
  if (!asset || asset->is_ton) {
    return std::nullopt;
  }
  return normalize_address(asset->jetton_address);
}

}  // namespace indexer
