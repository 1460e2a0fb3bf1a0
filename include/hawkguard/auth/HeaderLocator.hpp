//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HeaderLocator.hpp
// Purpose: Presence and uniqueness rules for a single authentication header
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "hawkguard/auth/RequestHeaders.hpp"

namespace hawkguard::auth {

//==========================================================================================================
// LocateResult
// Purpose: Result of picking the one value of a header.
// Fields:
//   ok: True when exactly one value was present.
//   value: That value (empty on failure).
//   httpStatus: On failure, 401 when the header is absent and 400 when it was sent more than once.
//==========================================================================================================
struct LocateResult {
    bool ok{false};
    std::string value;
    int httpStatus{401};
};

//==========================================================================================================
// LocateHeader
// Purpose: Require exactly one value. Repeated headers are rejected even when the values are identical.
// Args:
//   values: Every value sent for one header name, in request order.
//==========================================================================================================
LocateResult LocateHeader(const std::vector<std::string>& values);

// Same, looking the values up by name in a request's headers.
LocateResult LocateHeader(const IRequestHeaders& headers, const std::string& name);

} // namespace hawkguard::auth
