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
#include <iostream>
#include <string>

#include "td/utils/OptionParser.h"
#include "td/utils/filesystem.h"
#include "td/utils/logging.h"
#include "td/utils/misc.h"

#include "common/indexer-errorcode.h"
#include "trace/msgpack-reader.h"
#include "trace/trace-assembler.h"
#include "trace/trace-json.h"

namespace {

// The input file holds one msgpack map: transaction or message hash -> encoded transaction record.
td::Result<indexer::PackedTransactions> read_packed_transactions(td::Slice data) {
  msgpack::object_handle handle;
  try {
    handle = msgpack::unpack(data.data(), data.size());
  } catch (const std::exception &e) {
    return td::Status::Error(indexer::ErrorCode::decode_error, PSLICE() << "malformed msgpack: " << e.what());
  }
  const msgpack::object &obj = handle.get();
  if (obj.type != msgpack::type::MAP) {
    return indexer::mp::bad_field("<root>", PSTRING() << "expected map, got " << indexer::mp::type_name(obj));
  }
  indexer::PackedTransactions res;
  for (td::uint32 i = 0; i < obj.via.map.size; i++) {
    const auto &kv = obj.via.map.ptr[i];
    std::string key;
    std::string value;
    TRY_STATUS(indexer::mp::read_hash(kv.key, key, PSLICE() << "key #" << i));
    TRY_STATUS(indexer::mp::read(kv.val, value, PSLICE() << "value #" << i));
    res.emplace(std::move(key), std::move(value));
  }
  return res;
}

}  // namespace

int main(int argc, char *argv[]) {
  SET_VERBOSITY_LEVEL(verbosity_INFO);

  std::string file;
  std::string root;
  indexer::TraceAssembler::Options options;

  td::OptionParser p;
  p.set_description("assembles a trace from encoded transaction records and prints it as json");
  p.add_checked_option('v', "verbosity", "set verbosity level", [&](td::Slice arg) {
    TRY_RESULT(v, td::to_integer_safe<int>(arg));
    SET_VERBOSITY_LEVEL(VERBOSITY_NAME(FATAL) + v);
    return td::Status::OK();
  });
  p.add_option('h', "help", "prints help", [&]() {
    td::StringBuilder sb;
    sb << p;
    std::cout << sb.as_cslice().c_str();
    std::exit(2);
  });
  p.add_option('f', "file", "file with a msgpack map of hash to transaction record",
               [&](td::Slice fname) { file = fname.str(); });
  p.add_option('r', "root", "trace id, the hash of the root transaction", [&](td::Slice arg) { root = arg.str(); });
  p.add_checked_option('m', "max-transactions", "fail on traces with more transactions (default=unlimited)",
                       [&](td::Slice arg) {
                         TRY_RESULT(v, td::to_integer_safe<size_t>(arg));
                         options.max_transactions = v;
                         return td::Status::OK();
                       });
  auto S = p.run(argc, argv);
  if (S.is_error()) {
    std::cerr << S.move_as_error().message().str() << std::endl;
    return 2;
  }
  if (file.empty() || root.empty()) {
    std::cerr << "both --file and --root are required" << std::endl;
    return 2;
  }

  auto R = [&]() -> td::Status {
    TRY_RESULT_PREFIX(data, td::read_file(file), PSLICE() << "failed to read '" << file << "': ");
    TRY_RESULT(packed, read_packed_transactions(data.as_slice()));
    LOG(INFO) << "loaded " << packed.size() << " records from " << file;
    TRY_RESULT(trace, indexer::TraceAssembler(options).assemble(root, packed));
    std::cout << indexer::to_json(trace) << std::endl;
    return td::Status::OK();
  }();

  if (R.is_error()) {
    LOG(ERROR) << "trace " << root << ": " << R;
    return 1;
  }
  return 0;
}
