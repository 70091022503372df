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

#include "td/utils/Slice.h"
#include "td/utils/Status.h"
#include "td/utils/logging.h"

#include "common/indexer-errorcode.h"

#include <msgpack.hpp>

#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace indexer {

namespace mp {

// Positional readers over a parsed msgpack object. Every helper fails with
// ErrorCode::decode_error naming the field; nothing is silently defaulted.

td::Status bad_field(td::Slice field, td::Slice what);

td::Slice type_name(const msgpack::object &obj);

// Checks that obj is an array of exactly `arity` elements and returns its first element.
td::Result<const msgpack::object *> unpack_tuple(const msgpack::object &obj, size_t arity, td::Slice field);

td::Status read(const msgpack::object &obj, bool &value, td::Slice field);

// Accepts both str and bin, upstream uses either for hashes and BoCs.
td::Status read(const msgpack::object &obj, std::string &value, td::Slice field);

// Hashes keep their str form; raw bin hashes are hex encoded so they stay printable and comparable with str keys.
td::Status read_hash(const msgpack::object &obj, std::string &value, td::Slice field);

template <class T>
std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, td::Status> read(
    const msgpack::object &obj, T &value, td::Slice field) {
  if (obj.type == msgpack::type::POSITIVE_INTEGER) {
    if (obj.via.u64 > static_cast<td::uint64>(std::numeric_limits<T>::max())) {
      return bad_field(field, PSTRING() << "value " << obj.via.u64 << " is out of range");
    }
    value = static_cast<T>(obj.via.u64);
    return td::Status::OK();
  }
  if (obj.type == msgpack::type::NEGATIVE_INTEGER) {
    if constexpr (std::is_signed<T>::value) {
      if (obj.via.i64 < static_cast<td::int64>(std::numeric_limits<T>::min())) {
        return bad_field(field, PSTRING() << "value " << obj.via.i64 << " is out of range");
      }
      value = static_cast<T>(obj.via.i64);
      return td::Status::OK();
    } else {
      return bad_field(field, PSTRING() << "negative value " << obj.via.i64 << " for unsigned field");
    }
  }
  return bad_field(field, PSTRING() << "expected integer, got " << type_name(obj));
}

template <class T>
td::Status read(const msgpack::object &obj, std::optional<T> &value, td::Slice field) {
  if (obj.type == msgpack::type::NIL) {
    value.reset();
    return td::Status::OK();
  }
  T res{};
  TRY_STATUS(read(obj, res, field));
  value = std::move(res);
  return td::Status::OK();
}

}  // namespace mp

}  // namespace indexer
