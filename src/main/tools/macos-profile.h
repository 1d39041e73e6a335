/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_MACOS_PROFILE_H_
#define SRC_MAIN_TOOLS_MACOS_PROFILE_H_

#include <string>
#include <vector>

#include "src/main/tools/policy.h"

namespace tinycage {

// Quotes `value` as an SBPL string literal, including the surrounding quotes.
std::string EscapeProfileString(const std::string& value);

// False for paths a profile cannot name safely: relative paths and paths
// containing control characters.
bool IsRepresentable(const std::string& path);

// Builds a Seatbelt profile that denies everything by default and allows
// exactly `entries`. Rules are emitted shallowest path first, so the rules of
// a deeper entry override the ones of the directory above it. Entries that
// cannot be represented, or are still pending, are left out.
std::string SynthesizeProfile(const std::vector<PolicyEntry>& entries,
                              const std::vector<SymlinkAlias>& aliases,
                              bool network_allowed);

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_MACOS_PROFILE_H_
