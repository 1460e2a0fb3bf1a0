//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Guard.hpp
// Purpose: Request guards requiring one syntactically valid Hawk Authorization or Server-Authorization
//          header. They only check that a credential is present and well formed; verifying the MAC,
//          nonce and timestamp is left to the caller (e.g. a guard wrapping one of these).
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <variant>

#include "hawkguard/auth/RequestHeaders.hpp"
#include "hawkguard/errors/Errors.h"
#include "hawkguard/hawk/Header.hpp"

namespace hawkguard::auth {

//==========================================================================================================
// GuardOutcome
// Purpose: Holds exactly one of a successful guard value or a GuardFailure.
//==========================================================================================================
template <typename T>
class GuardOutcome {
public:
    static GuardOutcome Succeed(T value) {
        return GuardOutcome(std::variant<T, errors::GuardFailure>(std::in_place_index<0>, std::move(value)));
    }

    static GuardOutcome Fail(errors::GuardFailure failure) {
        return GuardOutcome(std::variant<T, errors::GuardFailure>(std::in_place_index<1>, std::move(failure)));
    }

    static GuardOutcome Fail(errors::HawkError error, int httpStatus) {
        return Fail(errors::GuardFailure{ std::move(error), httpStatus });
    }

    bool Ok() const { return state.index() == 0; }
    explicit operator bool() const { return Ok(); }

    // Throws std::bad_variant_access when called on the other alternative.
    const T& Value() const { return std::get<0>(state); }
    T TakeValue() && { return std::get<0>(std::move(state)); }
    const errors::GuardFailure& Failure() const { return std::get<1>(state); }

private:
    explicit GuardOutcome(std::variant<T, errors::GuardFailure> s) : state(std::move(s)) {}

    std::variant<T, errors::GuardFailure> state;
};

//==========================================================================================================
// ParseAuthzHeader
// Purpose: Shared extraction routine behind both guards.
//   1. exactly one header named headerName  -> else NoHeader (401 absent, 400 repeated)
//   2. value is "Hawk <payload>" (any case) -> else NoHeader (401)
//   3. payload parses as a Hawk attribute list -> else MalformedCredential (401)
// Args:
//   headers: The request's headers.
//   headerName: Header to inspect (case-insensitive).
//==========================================================================================================
GuardOutcome<hawk::HawkHeader> ParseAuthzHeader(const IRequestHeaders& headers, const std::string& headerName);

//==========================================================================================================
// AuthzHeader
// Purpose: Read-only access to the parsed Hawk attributes, shared by both guard types.
//==========================================================================================================
class AuthzHeader {
public:
    const hawk::HawkHeader& Get() const { return header; }
    const hawk::HawkHeader& operator*() const { return header; }
    const hawk::HawkHeader* operator->() const { return &header; }

protected:
    explicit AuthzHeader(hawk::HawkHeader h) : header(std::move(h)) {}

private:
    hawk::HawkHeader header;
};

// Guard for the client-sent "Authorization" header.
class AuthorizationHeader final : public AuthzHeader {
public:
    static constexpr const char* kHeaderName = "authorization";

    static GuardOutcome<AuthorizationHeader> FromRequest(const IRequestHeaders& headers);

private:
    explicit AuthorizationHeader(hawk::HawkHeader h) : AuthzHeader(std::move(h)) {}
};

// Guard for the Hawk-specific, server-sent "Server-Authorization" header.
class ServerAuthorizationHeader final : public AuthzHeader {
public:
    static constexpr const char* kHeaderName = "server-authorization";

    static GuardOutcome<ServerAuthorizationHeader> FromRequest(const IRequestHeaders& headers);

private:
    explicit ServerAuthorizationHeader(hawk::HawkHeader h) : AuthzHeader(std::move(h)) {}
};

} // namespace hawkguard::auth
