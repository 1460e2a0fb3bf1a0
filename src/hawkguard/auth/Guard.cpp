//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hawkguard/auth/Guard.cpp
// Purpose: Authorization / Server-Authorization Hawk header guards
//==========================================================================================================

#include "hawkguard/auth/Guard.hpp"

#include "hawkguard/auth/HeaderLocator.hpp"
#include "hawkguard/auth/SchemeSplitter.hpp"

namespace hawkguard::auth {

GuardOutcome<hawk::HawkHeader> ParseAuthzHeader(const IRequestHeaders& headers, const std::string& headerName) {
    using Outcome = GuardOutcome<hawk::HawkHeader>;

    // Exactly one header
    LocateResult located = LocateHeader(headers, headerName);
    if (!located.ok) {
        return Outcome::Fail(errors::NoHeader{}, located.httpStatus);
    }

    // "Hawk <value>", scheme case-insensitive
    auto payload = SplitScheme(located.value, kHawkScheme);
    if (!payload) {
        return Outcome::Fail(errors::NoHeader{}, errors::HttpStatus::Unauthorized);
    }

    hawk::HawkHeader parsed;
    hawk::HeaderParseError err;
    if (!hawk::ParseHawkHeader(*payload, parsed, err)) {
        return Outcome::Fail(errors::MalformedCredential{ std::move(err) }, errors::HttpStatus::Unauthorized);
    }
    return Outcome::Succeed(std::move(parsed));
}

GuardOutcome<AuthorizationHeader> AuthorizationHeader::FromRequest(const IRequestHeaders& headers) {
    auto parsed = ParseAuthzHeader(headers, kHeaderName);
    if (!parsed.Ok()) {
        return GuardOutcome<AuthorizationHeader>::Fail(parsed.Failure());
    }
    return GuardOutcome<AuthorizationHeader>::Succeed(AuthorizationHeader(std::move(parsed).TakeValue()));
}

GuardOutcome<ServerAuthorizationHeader> ServerAuthorizationHeader::FromRequest(const IRequestHeaders& headers) {
    auto parsed = ParseAuthzHeader(headers, kHeaderName);
    if (!parsed.Ok()) {
        return GuardOutcome<ServerAuthorizationHeader>::Fail(parsed.Failure());
    }
    return GuardOutcome<ServerAuthorizationHeader>::Succeed(ServerAuthorizationHeader(std::move(parsed).TakeValue()));
}

} // namespace hawkguard::auth
