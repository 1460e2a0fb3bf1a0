//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hawkguard/auth/RequestHeaders.cpp
// Purpose: IRequestHeaders implementations (in-memory list and Boost.Beast fields)
//==========================================================================================================

#include "hawkguard/auth/RequestHeaders.hpp"

#include <boost/beast/core/string.hpp>

namespace hawkguard::auth {

std::vector<std::string> HeaderList::Values(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& h : headers) {
        if (boost::beast::iequals(h.name, name)) {
            out.push_back(h.value);
        }
    }
    return out;
}

std::vector<std::string> BeastRequestHeaders::Values(const std::string& name) const {
    std::vector<std::string> out;
    auto range = fields.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        const auto v = it->value();
        out.emplace_back(v.data(), v.size());
    }
    return out;
}

} // namespace hawkguard::auth
