//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed guard failures and their HTTP status mapping
//==========================================================================================================

#pragma once

#include <string>
#include <variant>

#include "hawkguard/hawk/Header.hpp"

namespace hawkguard {
namespace errors {

// HTTP status codes a guard failure can carry.
namespace HttpStatus {
    static constexpr int BadRequest = 400;
    static constexpr int Unauthorized = 401;
}

// No usable header: absent, repeated, wrong scheme, or missing the space after the scheme.
struct NoHeader {};

// The header had the Hawk shape but its attribute list failed to parse.
struct MalformedCredential {
    hawk::HeaderParseError cause;
};

// Closed set of guard failure reasons.
using HawkError = std::variant<NoHeader, MalformedCredential>;

//==========================================================================================================
// GuardFailure
// Purpose: Failure reason paired with the HTTP status the host should answer with.
// Fields:
//   error: Why no credential was produced.
//   httpStatus: 401, or 400 when the header was repeated.
//==========================================================================================================
struct GuardFailure {
    HawkError error;
    int httpStatus{HttpStatus::Unauthorized};
};

inline bool IsNoHeader(const HawkError& e) {
    return std::holds_alternative<NoHeader>(e);
}

// Returns the wrapped parser error, or nullptr when the failure is NoHeader.
inline const hawk::HeaderParseError* GetParseError(const HawkError& e) {
    if (auto* m = std::get_if<MalformedCredential>(&e)) {
        return &m->cause;
    }
    return nullptr;
}

//==========================================================================================================
// DescribeError
// Purpose: Human-readable text for logs and response bodies.
// Returns:
//   "no Hawk header" or "malformed Hawk header: <parser message>".
//==========================================================================================================
inline std::string DescribeError(const HawkError& e) {
    if (const auto* cause = GetParseError(e)) {
        return std::string("malformed Hawk header: ") + cause->message;
    }
    return std::string("no Hawk header");
}

} // namespace errors
} // namespace hawkguard
