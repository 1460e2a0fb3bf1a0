//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hawkguard/auth/HeaderLocator.cpp
// Purpose: Presence and uniqueness rules for a single authentication header
//==========================================================================================================

#include "hawkguard/auth/HeaderLocator.hpp"

#include "hawkguard/errors/Errors.h"

namespace hawkguard::auth {

LocateResult LocateHeader(const std::vector<std::string>& values) {
    LocateResult r;
    if (values.empty()) {
        r.ok = false;
        r.httpStatus = errors::HttpStatus::Unauthorized;
        return r;
    }
    if (values.size() > 1) {
        // Ambiguous credentials are a client protocol error, not an absence
        r.ok = false;
        r.httpStatus = errors::HttpStatus::BadRequest;
        return r;
    }
    r.ok = true;
    r.value = values.front();
    return r;
}

LocateResult LocateHeader(const IRequestHeaders& headers, const std::string& name) {
    return LocateHeader(headers.Values(name));
}

} // namespace hawkguard::auth
