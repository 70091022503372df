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
#include "msgpack-reader.h"

#include "td/utils/misc.h"

namespace indexer {

namespace mp {

td::Status bad_field(td::Slice field, td::Slice what) {
  return td::Status::Error(ErrorCode::decode_error, PSLICE() << "bad field '" << field << "': " << what);
}

td::Slice type_name(const msgpack::object &obj) {
  switch (obj.type) {
    case msgpack::type::NIL:
      return "nil";
    case msgpack::type::BOOLEAN:
      return "bool";
    case msgpack::type::POSITIVE_INTEGER:
    case msgpack::type::NEGATIVE_INTEGER:
      return "integer";
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64:
      return "float";
    case msgpack::type::STR:
      return "str";
    case msgpack::type::BIN:
      return "bin";
    case msgpack::type::ARRAY:
      return "array";
    case msgpack::type::MAP:
      return "map";
    case msgpack::type::EXT:
      return "ext";
  }
  return "unknown";
}

td::Result<const msgpack::object *> unpack_tuple(const msgpack::object &obj, size_t arity, td::Slice field) {
  if (obj.type != msgpack::type::ARRAY) {
    return bad_field(field, PSTRING() << "expected array of " << arity << " elements, got " << type_name(obj));
  }
  if (obj.via.array.size != arity) {
    return bad_field(field, PSTRING() << "expected " << arity << " elements, got " << obj.via.array.size);
  }
  return obj.via.array.ptr;
}

td::Status read(const msgpack::object &obj, bool &value, td::Slice field) {
  if (obj.type != msgpack::type::BOOLEAN) {
    return bad_field(field, PSTRING() << "expected bool, got " << type_name(obj));
  }
  value = obj.via.boolean;
  return td::Status::OK();
}

td::Status read(const msgpack::object &obj, std::string &value, td::Slice field) {
  if (obj.type == msgpack::type::STR) {
    value.assign(obj.via.str.ptr, obj.via.str.size);
    return td::Status::OK();
  }
  if (obj.type == msgpack::type::BIN) {
    value.assign(obj.via.bin.ptr, obj.via.bin.size);
    return td::Status::OK();
  }
  return bad_field(field, PSTRING() << "expected str or bin, got " << type_name(obj));
}

td::Status read_hash(const msgpack::object &obj, std::string &value, td::Slice field) {
  if (obj.type == msgpack::type::BIN) {
    value = td::hex_encode(td::Slice(obj.via.bin.ptr, obj.via.bin.size));
    return td::Status::OK();
  }
  return read(obj, value, field);
}

}  // namespace mp

}  // namespace indexer
