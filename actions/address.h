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

#include "block/block.h"

#include <optional>
#include <string>

namespace indexer {

// Either the native coin or a jetton identified by its master contract.
struct Asset {
  bool is_ton{true};
  std::optional<block::StdAddress> jetton_address;

  static Asset ton() {
    return Asset{};
  }
  static Asset jetton(const block::StdAddress &master) {
    return Asset{false, master};
  }
};

// "<workchain>:<HEX>" raw form.
std::string address_to_raw(const block::StdAddress &addr);

std::optional<std::string> normalize_address(const std::optional<block::StdAddress> &addr);

// Jetton master address in raw form, null for the native coin or an absent asset.
std::optional<std::string> normalize_asset(const std::optional<Asset> &asset);

}  // namespace indexer
