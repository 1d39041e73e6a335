/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_SPAWN_STATE_H_
#define SRC_MAIN_TOOLS_SPAWN_STATE_H_

#define MAX_STATUS_MSG 200

namespace tinycage {

// Lifecycle of one spawn attempt.
//
//   Created -> Forked -> PolicyApplied -> Execd
//                 |            |
//                 +-> Failed <-+
//
// Created can also fail directly when the child could not be created.
enum class SpawnState {
  Created,
  Forked,
  PolicyApplied,
  Execd,
  Failed,
};

const char* SpawnStateToString(SpawnState state);

bool IsLegalTransition(SpawnState from, SpawnState to);

class SpawnStateMachine {
 public:
  SpawnStateMachine() : state_(SpawnState::Created) {}

  SpawnState state() const { return state_; }
  bool IsTerminal() const {
    return state_ == SpawnState::Execd || state_ == SpawnState::Failed;
  }

  // Moves to `next`. Returns 0, or reports ErrorCode::Unknown for a transition
  // the lifecycle does not allow.
  int Advance(SpawnState next);

 private:
  SpawnState state_;
};

// Progress markers the child sends to the parent over the status pipe.
enum StatusStage : int {
  STAGE_POLICY_APPLIED = 1,
  STAGE_POLICY_FAILED = 2,
  STAGE_WORKING_DIR_FAILED = 3,
  STAGE_EXEC_FAILED = 4,
};

// Fixed size record written with a single write(2), so it needs no
// allocation on the child side and arrives in one piece.
struct StatusRecord {
  int stage;
  int err;
  char msg[MAX_STATUS_MSG];
};

// Fills `record` without allocating. `what` and `detail` may be null.
void FillStatusRecord(StatusRecord* record, int stage, int err, const char* what,
                      const char* detail);

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_SPAWN_STATE_H_
