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

#include "td/utils/logging.h"

namespace indexer {

enum ErrorCode {
  decode_error = 701,
  missing_transaction = 702,
  missing_required_field = 703,
  trace_too_large = 704
};

constexpr int VERBOSITY_NAME(INDEXER_WARNING) = verbosity_WARNING;
constexpr int VERBOSITY_NAME(INDEXER_INFO) = verbosity_INFO;
constexpr int VERBOSITY_NAME(INDEXER_DEBUG) = verbosity_DEBUG;

}  // namespace indexer
