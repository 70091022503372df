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
#include "trace-types.h"

#include "td/utils/logging.h"

namespace indexer {

td::Slice to_string(AccountStatus status) {
  switch (status) {
    case AccountStatus::uninit:
      return "uninit";
    case AccountStatus::frozen:
      return "frozen";
    case AccountStatus::active:
      return "active";
    case AccountStatus::nonexist:
      return "nonexist";
  }
  UNREACHABLE();
}

td::Slice to_string(AccStatusChange status_change) {
  switch (status_change) {
    case AccStatusChange::unchanged:
      return "unchanged";
    case AccStatusChange::frozen:
      return "frozen";
    case AccStatusChange::deleted:
      return "deleted";
  }
  UNREACHABLE();
}

td::Slice to_string(ComputeSkipReason reason) {
  switch (reason) {
    case ComputeSkipReason::no_state:
      return "cskip_no_state";
    case ComputeSkipReason::bad_state:
      return "cskip_bad_state";
    case ComputeSkipReason::no_gas:
      return "cskip_no_gas";
    case ComputeSkipReason::suspended:
      return "cskip_suspended";
  }
  UNREACHABLE();
}

td::Slice to_string(MessageDirection direction) {
  return direction == MessageDirection::in ? td::Slice("in") : td::Slice("out");
}

td::Slice to_string(ClassificationState state) {
  switch (state) {
    case ClassificationState::unclassified:
      return "unclassified";
    case ClassificationState::ok:
      return "ok";
    case ClassificationState::failed:
      return "failed";
  }
  UNREACHABLE();
}

td::Slice to_string(TraceState state) {
  return state == TraceState::complete ? td::Slice("complete") : td::Slice("pending");
}

}  // namespace indexer
