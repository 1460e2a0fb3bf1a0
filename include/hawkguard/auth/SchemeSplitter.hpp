//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemeSplitter.hpp
// Purpose: Split "<scheme> <credentials>" header values on the first space
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace hawkguard::auth {

// Authentication scheme accepted by the guards (matched ASCII case-insensitively).
inline constexpr const char* kHawkScheme = "Hawk";

//==========================================================================================================
// SplitScheme
// Purpose: Match the scheme token of an authentication header value and return what follows it.
// Args:
//   raw: Full header value, e.g. "Hawk id=\"abc\", mac=\"...\"".
//   scheme: Expected scheme token.
// Returns:
//   Everything after the first space when the text before it equals scheme ignoring ASCII case;
//   std::nullopt when there is no space or the token differs.
// Notes:
//   - Only ' ' delimits. Further spaces are kept as part of the returned payload.
//   - "Hawk" alone (no space) fails; "Hawk " yields an empty payload.
//==========================================================================================================
std::optional<std::string> SplitScheme(const std::string& raw, const std::string& scheme);

} // namespace hawkguard::auth
