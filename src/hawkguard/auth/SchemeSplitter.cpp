//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hawkguard/auth/SchemeSplitter.cpp
// Purpose: Split "<scheme> <credentials>" header values on the first space
//==========================================================================================================

#include "hawkguard/auth/SchemeSplitter.hpp"

namespace hawkguard::auth {

namespace {
    // ASCII folding only, independent of the global locale
    char asciiLower(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    bool icaseEqual(char a, char b) {
        return asciiLower(a) == asciiLower(b);
    }

    bool icaseEquals(const std::string& s, size_t len, const std::string& token) {
        if (len != token.size()) {
            return false;
        }
        for (size_t i = 0; i < len; ++i) {
            if (!icaseEqual(s[i], token[i])) {
                return false;
            }
        }
        return true;
    }
}

std::optional<std::string> SplitScheme(const std::string& raw, const std::string& scheme) {
    const size_t sp = raw.find(' ');
    if (sp == std::string::npos) {
        return std::nullopt;
    }
    if (!icaseEquals(raw, sp, scheme)) {
        return std::nullopt;
    }
    return raw.substr(sp + 1);
}

} // namespace hawkguard::auth
