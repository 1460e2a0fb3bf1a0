//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hawkguard/hawk/Header.cpp
// Purpose: Hawk credential value grammar (parse and format) with OpenSSL-backed base64
//==========================================================================================================

#include "hawkguard/hawk/Header.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <openssl/evp.h>

namespace hawkguard::hawk {

namespace {

    bool isSpace(char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    void skipSeparators(const std::string& s, size_t& i) {
        while (i < s.size() && (s[i] == ',' || isSpace(s[i]))) {
            ++i;
        }
    }

    void skipSpaces(const std::string& s, size_t& i) {
        while (i < s.size() && isSpace(s[i])) {
            ++i;
        }
    }

    std::string trim(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && isSpace(s[b])) ++b;
        while (e > b && isSpace(s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    bool fail(HeaderParseError& err, ParseErrorKind kind, std::string message) {
        err.kind = kind;
        err.message = std::move(message);
        return false;
    }

    bool isBase64Char(char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return std::isalnum(c) != 0 || ch == '+' || ch == '/';
    }

    bool parseTimestamp(const std::string& text, std::chrono::system_clock::time_point& out) {
        if (text.empty()) {
            return false;
        }
        for (char ch : text) {
            if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
                return false;
            }
        }
        unsigned long long secs = 0;
        try {
            secs = std::stoull(text);
        } catch (const std::out_of_range&) {
            return false;
        }
        // system_clock may tick in nanoseconds; stay within its representable range
        const auto maxSecs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::duration::max()).count();
        if (secs > static_cast<unsigned long long>(maxSecs)) {
            return false;
        }
        out = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(static_cast<long long>(secs))));
        return true;
    }

    void appendField(std::string& out, const char* name, const std::string& value) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
        out += "=\"";
        out += value;
        out += "\"";
    }

} // namespace

std::string EncodeBase64(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(), static_cast<int>(bytes.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::optional<std::vector<unsigned char>> DecodeBase64(const std::string& text) {
    if (text.empty()) {
        return std::vector<unsigned char>();
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock tolerates surrounding whitespace; require the strict alphabet here
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '=') {
            ++padding;
            continue;
        }
        if (padding != 0 || !isBase64Char(ch)) {
            return std::nullopt;
        }
    }
    if (padding > 2) {
        return std::nullopt;
    }
    std::vector<unsigned char> out(3 * (text.size() / 4));
    int n = ::EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding positions as zero bytes
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

bool ParseHawkHeader(const std::string& value, HawkHeader& out, HeaderParseError& err) {
    out = HawkHeader{};

    size_t i = 0;
    for (;;) {
        skipSeparators(value, i);
        if (i >= value.size()) {
            break;
        }

        // Attribute name runs up to '='
        const size_t eq = value.find('=', i);
        if (eq == std::string::npos) {
            return fail(err, ParseErrorKind::Syntax, "Expected '=' in Hawk header");
        }
        const std::string name = trim(value.substr(i, eq - i));
        i = eq + 1;
        skipSpaces(value, i);

        // Quoted value; escapes are not supported
        if (i >= value.size() || value[i] != '"') {
            return fail(err, ParseErrorKind::Syntax, "Expected opening quote in Hawk header");
        }
        ++i;
        const size_t close = value.find('"', i);
        if (close == std::string::npos) {
            return fail(err, ParseErrorKind::Syntax, "Expected closing quote in Hawk header");
        }
        const std::string attr = value.substr(i, close - i);
        i = close + 1;

        std::optional<std::string>* text = nullptr;
        if (name == "id") {
            text = &out.id;
        } else if (name == "nonce") {
            text = &out.nonce;
        } else if (name == "ext") {
            text = &out.ext;
        } else if (name == "app") {
            text = &out.app;
        } else if (name == "dlg") {
            text = &out.dlg;
        } else if (name == "ts") {
            std::chrono::system_clock::time_point tp;
            if (!parseTimestamp(attr, tp)) {
                return fail(err, ParseErrorKind::InvalidTimestamp, "Invalid Hawk timestamp " + attr);
            }
            out.ts = tp;
            continue;
        } else if (name == "mac" || name == "hash") {
            auto bytes = DecodeBase64(attr);
            if (!bytes) {
                return fail(err, ParseErrorKind::InvalidBase64, "Invalid base64 in Hawk field " + name);
            }
            if (name == "mac") {
                out.mac = std::move(*bytes);
            } else {
                out.hash = std::move(*bytes);
            }
            continue;
        } else {
            return fail(err, ParseErrorKind::InvalidField, "Invalid Hawk field " + name);
        }

        if (attr.find('\\') != std::string::npos) {
            return fail(err, ParseErrorKind::ForbiddenCharacter, "Hawk header values cannot contain '\\'");
        }
        *text = attr;
    }

    return true;
}

bool FormatHawkHeader(const HawkHeader& header, std::string& out, HeaderParseError& err) {
    out.clear();

    // Quoted values have no escape syntax
    const std::pair<const char*, const std::optional<std::string>*> textFields[] = {
        {"id", &header.id}, {"nonce", &header.nonce}, {"ext", &header.ext},
        {"app", &header.app}, {"dlg", &header.dlg},
    };
    for (const auto& [name, field] : textFields) {
        if (*field && (*field)->find_first_of("\"\\") != std::string::npos) {
            return fail(err, ParseErrorKind::ForbiddenCharacter,
                        std::string("Hawk field ") + name + " cannot contain '\"' or '\\'");
        }
    }
    long long secs = 0;
    if (header.ts) {
        secs = std::chrono::duration_cast<std::chrono::seconds>(header.ts->time_since_epoch()).count();
        if (secs < 0) {
            return fail(err, ParseErrorKind::InvalidTimestamp, "Invalid Hawk timestamp " + std::to_string(secs));
        }
    }

    if (header.id) {
        appendField(out, "id", *header.id);
    }
    if (header.ts) {
        appendField(out, "ts", std::to_string(secs));
    }
    if (header.nonce) {
        appendField(out, "nonce", *header.nonce);
    }
    if (header.mac) {
        appendField(out, "mac", EncodeBase64(*header.mac));
    }
    if (header.ext) {
        appendField(out, "ext", *header.ext);
    }
    if (header.hash) {
        appendField(out, "hash", EncodeBase64(*header.hash));
    }
    if (header.app) {
        appendField(out, "app", *header.app);
    }
    if (header.dlg) {
        appendField(out, "dlg", *header.dlg);
    }
    return true;
}

bool MakeHawkAuthorizationValue(const HawkHeader& header, std::string& out, HeaderParseError& err) {
    std::string attrs;
    if (!FormatHawkHeader(header, attrs, err)) {
        return false;
    }
    out = std::string("Hawk ") + attrs;
    return true;
}

} // namespace hawkguard::hawk
