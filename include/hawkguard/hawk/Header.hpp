//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Header.hpp
// Purpose: Hawk credential value grammar: the attribute list that follows the "Hawk " scheme token
//          in Authorization and Server-Authorization headers.
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hawkguard::hawk {

//==========================================================================================================
// HawkHeader
// Purpose: Parsed Hawk attribute list. Every attribute is optional at the grammar level; deciding which
//          ones a request must carry belongs to whoever verifies the credential.
// Fields:
//   id: Key identifier.
//   ts: Timestamp (whole seconds since the Unix epoch).
//   nonce: Client-chosen nonce.
//   mac: Decoded MAC bytes (base64 on the wire).
//   ext: Application-specific extension data.
//   hash: Decoded payload hash bytes (base64 on the wire).
//   app, dlg: Oz application and delegation identifiers.
//==========================================================================================================
struct HawkHeader {
    std::optional<std::string> id;
    std::optional<std::chrono::system_clock::time_point> ts;
    std::optional<std::string> nonce;
    std::optional<std::vector<unsigned char>> mac;
    std::optional<std::string> ext;
    std::optional<std::vector<unsigned char>> hash;
    std::optional<std::string> app;
    std::optional<std::string> dlg;
};

// Classification of Hawk grammar failures.
enum class ParseErrorKind {
    Syntax,
    InvalidField,
    InvalidTimestamp,
    InvalidBase64,
    ForbiddenCharacter
};

//==========================================================================================================
// HeaderParseError
// Purpose: Error reported by ParseHawkHeader. The message is stable and suitable for diagnostics,
//          e.g. "Invalid Hawk field nosuchfield".
//==========================================================================================================
struct HeaderParseError {
    ParseErrorKind kind{ParseErrorKind::Syntax};
    std::string message;
};

//==========================================================================================================
// ParseHawkHeader
// Purpose: Parse a Hawk attribute list of the form  id="...", ts="...", nonce="...", mac="..."
// Args:
//   value: The text following "Hawk " in the header value (may be empty).
//   out: Populated on success; reset before parsing.
//   err: Populated on failure.
// Returns:
//   true on success; false on failure (err set).
// Notes:
//   - Attributes are separated by commas and/or whitespace; values must be double-quoted.
//   - Quoted values cannot contain escapes; a backslash anywhere in a value is rejected.
//   - A repeated attribute replaces the earlier value.
//==========================================================================================================
bool ParseHawkHeader(const std::string& value, HawkHeader& out, HeaderParseError& err);

//==========================================================================================================
// FormatHawkHeader
// Purpose: Render the present attributes as  name="value"  pairs joined by ", ", in the order
//          id, ts, nonce, mac, ext, hash, app, dlg. Byte fields are base64-encoded.
// Args:
//   header: Attributes to render.
//   out: The rendered attribute list on success.
//   err: Populated on failure.
// Returns:
//   true on success; false when the output would not parse back as the same attributes:
//     - a text field containing '"' or '\' -> ForbiddenCharacter
//     - a timestamp before the epoch      -> InvalidTimestamp
//==========================================================================================================
bool FormatHawkHeader(const HawkHeader& header, std::string& out, HeaderParseError& err);

// Convenience: "Hawk " + FormatHawkHeader(header), ready to send as an Authorization value.
bool MakeHawkAuthorizationValue(const HawkHeader& header, std::string& out, HeaderParseError& err);

// Standard base64 helpers (RFC 4648, padded). DecodeBase64 returns std::nullopt for malformed input.
std::string EncodeBase64(const std::vector<unsigned char>& bytes);
std::optional<std::vector<unsigned char>> DecodeBase64(const std::string& text);

} // namespace hawkguard::hawk
