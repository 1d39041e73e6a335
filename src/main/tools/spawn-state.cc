/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/spawn-state.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

#include <string.h>

namespace tinycage {

const char* SpawnStateToString(SpawnState state) {
  switch (state) {
    case SpawnState::Created:
      return "Created";
    case SpawnState::Forked:
      return "Forked";
    case SpawnState::PolicyApplied:
      return "PolicyApplied";
    case SpawnState::Execd:
      return "Exec'd";
    case SpawnState::Failed:
      return "Failed";
  }
  return "Unknown";
}


bool IsLegalTransition(SpawnState from, SpawnState to) {
  switch (from) {
    case SpawnState::Created:
      return to == SpawnState::Forked || to == SpawnState::Failed;
    case SpawnState::Forked:
      return to == SpawnState::PolicyApplied || to == SpawnState::Failed;
    case SpawnState::PolicyApplied:
      return to == SpawnState::Execd || to == SpawnState::Failed;
    case SpawnState::Execd:
    case SpawnState::Failed:
      return false;
  }
  return false;
}


int SpawnStateMachine::Advance(SpawnState next) {
  if (!IsLegalTransition(state_, next)) {
    std::string msg = std::string("illegal spawn transition ") + SpawnStateToString(state_) +
                      " -> " + SpawnStateToString(next);
    return TinyCageReportErrorAndMessage(msg, ErrorCode::Unknown);
  }
  PRINT_DEBUG("spawn state %s -> %s", SpawnStateToString(state_), SpawnStateToString(next));
  state_ = next;
  return 0;
}


static size_t AppendBounded(char* dst, size_t used, const char* src) {
  while (src != nullptr && *src != '\0' && used + 1 < MAX_STATUS_MSG) {
    dst[used++] = *src++;
  }
  dst[used] = '\0';
  return used;
}


void FillStatusRecord(StatusRecord* record, int stage, int err, const char* what,
                      const char* detail) {
  memset(record, 0, sizeof(*record));
  record->stage = stage;
  record->err = err;
  size_t used = AppendBounded(record->msg, 0, what);
  if (detail != nullptr && *detail != '\0') {
    used = AppendBounded(record->msg, used, " ");
    AppendBounded(record->msg, used, detail);
  }
}

}  // namespace tinycage
