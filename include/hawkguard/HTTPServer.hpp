//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Minimal coroutine-based HTTP/1.1 host using Boost.Beast, with helpers that put the Hawk
//          guards in front of route handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include <boost/beast/http.hpp>

#include "hawkguard/auth/Guard.hpp"
#include "hawkguard/auth/RequestHeaders.hpp"
#include "hawkguard/errors/Errors.h"

namespace hawkguard {

class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address and port. Port "0" binds an ephemeral port (see LocalPort()).
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
    };

    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Handler = std::function<Response(const Request&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    // Throws std::invalid_argument when the port is not a number in [0, 65535].
    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Binds, listens and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the socket is listening, or holds the bind/listen exception.
    //   Holds std::logic_error when the server is already running. A stopped server can be started again.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor on the I/O thread, waits for the accept loop to finish,
    // then stops the I/O context and joins the background thread. No-op when not running.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // Route
    // Purpose: Register a handler for an exact request target and method. Register before Start().
    // Notes:
    //   - Unknown target -> 404; known target with an unregistered method -> 405.
    //   - A handler that throws produces a 500 and is reported to the error handler.
    //==========================================================================================================
    void Route(boost::beast::http::verb method, const std::string& path, Handler handler);

    // Sets the error handler for session and handler errors. May be called while running.
    void SetErrorHandler(ErrorHandler handler);

    // Port actually bound; 0 while not running.
    unsigned short LocalPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// MakeJsonResponse
// Purpose: Build a "Connection: close" application/json response matching the request's HTTP version.
//==========================================================================================================
HTTPServer::Response MakeJsonResponse(const HTTPServer::Request& req,
                                      boost::beast::http::status status,
                                      const std::string& body);

//==========================================================================================================
// MakeGuardFailureResponse
// Purpose: Render a guard failure: the outcome's status, {"error":"<description>"} and, for 401,
//          a "WWW-Authenticate: Hawk" challenge.
//==========================================================================================================
HTTPServer::Response MakeGuardFailureResponse(const HTTPServer::Request& req, const errors::GuardFailure& failure);

//==========================================================================================================
// RequireGuard
// Purpose: Wrap a handler so it only runs with a successfully parsed guard value.
// Template Args:
//   Guard: auth::AuthorizationHeader or auth::ServerAuthorizationHeader.
// Args:
//   handler: Callable (const Request&, const Guard&) -> Response.
//==========================================================================================================
template <typename Guard, typename F>
HTTPServer::Handler RequireGuard(F handler) {
    return [handler = std::move(handler)](const HTTPServer::Request& req) -> HTTPServer::Response {
        auth::BeastRequestHeaders headers(req);
        auto outcome = Guard::FromRequest(headers);
        if (!outcome.Ok()) {
            return MakeGuardFailureResponse(req, outcome.Failure());
        }
        return handler(req, outcome.Value());
    };
}

//==========================================================================================================
// HTTPServerFactory
// Purpose: Create a server from a URI-style configuration string:
//            - "http://<address>:<port>"  (e.g., http://127.0.0.1:0)
//            - "[<ipv6>]:<port>" or "<address>" (port defaults to 8080)
//          The scheme may be omitted; any path or query is ignored.
//==========================================================================================================
class HTTPServerFactory {
public:
    static HTTPServer::Options ParseOptions(const std::string& config);
    std::unique_ptr<HTTPServer> Create(const std::string& config);
};

} // namespace hawkguard
