//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestHeaders.hpp
// Purpose: Read-only, multi-valued header lookup that guards evaluate against
//==========================================================================================================

#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include <boost/beast/http/fields.hpp>

namespace hawkguard::auth {

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// IRequestHeaders
// Purpose: Host-supplied view of one request's headers.
//==========================================================================================================
class IRequestHeaders {
public:
    virtual ~IRequestHeaders() = default;

    // All values for the header name (ASCII case-insensitive), in request order.
    virtual std::vector<std::string> Values(const std::string& name) const = 0;
};

//==========================================================================================================
// HeaderList
// Purpose: In-memory header collection, e.g. for hosts that keep headers as name/value pairs.
//==========================================================================================================
class HeaderList final : public IRequestHeaders {
public:
    HeaderList() = default;
    HeaderList(std::initializer_list<HeaderKV> init) : headers(init) {}

    void Add(std::string name, std::string value) {
        headers.push_back(HeaderKV{ std::move(name), std::move(value) });
    }

    std::vector<std::string> Values(const std::string& name) const override;

private:
    std::vector<HeaderKV> headers;
};

//==========================================================================================================
// BeastRequestHeaders
// Purpose: Adapter over Boost.Beast header fields. Non-owning; the fields must outlive this object.
//==========================================================================================================
class BeastRequestHeaders final : public IRequestHeaders {
public:
    explicit BeastRequestHeaders(const boost::beast::http::fields& fields) : fields(fields) {}

    std::vector<std::string> Values(const std::string& name) const override;

private:
    const boost::beast::http::fields& fields;
};

} // namespace hawkguard::auth
