//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/hawkguard/HTTPServer.cpp
// Purpose: Minimal coroutine-based HTTP/1.1 host using Boost.Beast
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "hawkguard/HTTPServer.hpp"
#include "hawkguard/auth/SchemeSplitter.hpp"

namespace hawkguard {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

    void validatePort(const std::string& port) {
        if (port.empty()) {
            throw std::invalid_argument("HTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(port.begin(), port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || port.size() > 5) {
            throw std::invalid_argument(std::string("HTTPServer invalid port (non-numeric): ") + port);
        }
        if (std::stoul(port) > 65535ul) {
            throw std::invalid_argument(std::string("HTTPServer invalid port (out of range): ") + port);
        }
    }

    std::string jsonEscape(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 2);
        for (char ch : s) {
            switch (ch) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(ch) < 0x20) {
                        out += ' ';
                    } else {
                        out += ch;
                    }
            }
        }
        return out;
    }

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    net::io_context ioc;
    // keeps ioc.run() from returning until Stop()
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::promise<void> acceptDone;

    // target -> method -> handler
    std::map<std::string, std::map<http::verb, HTTPServer::Handler>> routes;
    std::mutex errorMutex;
    HTTPServer::ErrorHandler errorHandler;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        validatePort(opts.port);
    }

    ~Impl() {
        if (ioThread.joinable()) {
            work.reset();
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        HTTPServer::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            handler = errorHandler;
        }
        if (handler) { handler(msg); }
    }

    void listen() {
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = dispatch(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            // single request per connection
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer session error: ") + e.what());
            } else {
                LOG_DEBUG("HTTPServer session ended during shutdown: {}", e.what());
            }
        }
        co_return;
    }

    http::response<http::string_body> dispatch(const http::request<http::string_body>& req) {
        const auto t = req.target();
        const std::string target(t.data(), t.size());

        auto it = routes.find(target);
        if (it == routes.end()) {
            return MakeJsonResponse(req, http::status::not_found, "{\"error\":\"Not found\"}");
        }
        auto hit = it->second.find(req.method());
        if (hit == it->second.end()) {
            return MakeJsonResponse(req, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
        }
        try {
            auto res = hit->second(req);
            res.keep_alive(false);
            res.prepare_payload();
            return res;
        } catch (const std::exception& e) {
            setError(std::string("HTTPServer handler error: ") + e.what());
            return MakeJsonResponse(req, http::status::internal_server_error,
                                    std::string("{\"error\":\"") + jsonEscape(e.what()) + "\"}");
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer accept error: ") + e.what());
            } else {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("HTTPServer accept loop ended during shutdown: {}", e.what());
            }
        }
        acceptDone.set_value();
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load() || pImpl->ioThread.joinable()) {
        ready.set_exception(std::make_exception_ptr(std::logic_error("HTTPServer already started")));
        return fut;
    }
    try {
        pImpl->listen();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("HTTPServer listen error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    LOG_INFO("HTTPServer listening on {}:{}", pImpl->opts.address, pImpl->boundPort.load());

    // A previous Stop() leaves the context stopped
    pImpl->ioc.restart();
    pImpl->work.emplace(pImpl->ioc.get_executor());
    pImpl->acceptDone = std::promise<void>();
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        for (;;) {
            try {
                pImpl->ioc.run();
                break;
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            }
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    if (!pImpl->ioThread.joinable()) {
        done.set_value();
        return fut;
    }
    pImpl->running.store(false);

    // The acceptor belongs to the I/O thread; close it there and wait for the accept loop to exit
    auto acceptFinished = pImpl->acceptDone.get_future();
    net::post(pImpl->ioc, [this]() {
        if (pImpl->acceptor) {
            boost::system::error_code ec;
            pImpl->acceptor->close(ec);
            if (ec) {
                LOG_WARN("HTTPServer acceptor close: {}", ec.message());
            }
        }
    });
    acceptFinished.wait();

    pImpl->work.reset();
    pImpl->ioc.stop();
    pImpl->ioThread.join();
    pImpl->acceptor.reset();
    pImpl->boundPort.store(0);
    LOG_INFO("HTTPServer stopped");
    done.set_value();
    return fut;
}

void HTTPServer::Route(http::verb method, const std::string& path, Handler handler) {
    pImpl->routes[path][method] = std::move(handler);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->errorMutex);
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::LocalPort() const {
    return pImpl->boundPort.load();
}

HTTPServer::Response MakeJsonResponse(const HTTPServer::Request& req,
                                      http::status status,
                                      const std::string& body) {
    HTTPServer::Response res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body;
    res.prepare_payload();
    return res;
}

HTTPServer::Response MakeGuardFailureResponse(const HTTPServer::Request& req, const errors::GuardFailure& failure) {
    LOG_DEBUG("HTTPServer guard rejected {}: {} ({})", std::string(req.target().data(), req.target().size()),
              errors::DescribeError(failure.error), failure.httpStatus);
    auto res = MakeJsonResponse(req, static_cast<http::status>(failure.httpStatus),
                                std::string("{\"error\":\"") + jsonEscape(errors::DescribeError(failure.error)) + "\"}");
    if (failure.httpStatus == errors::HttpStatus::Unauthorized) {
        res.set(http::field::www_authenticate, auth::kHawkScheme);
    }
    return res;
}

HTTPServer::Options HTTPServerFactory::ParseOptions(const std::string& config) {
    HTTPServer::Options opts;

    std::string cfg = config;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        throw std::invalid_argument("HTTPServerFactory: https is not supported");
    }

    // Drop query and path
    std::string hostPort = cfg.substr(0, cfg.find_first_of("/?"));
    trim(hostPort);

    // host[:port], including [ipv6]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb == std::string::npos) {
                throw std::invalid_argument(std::string("HTTPServerFactory: unterminated IPv6 address: ") + config);
            }
            opts.address = hostPort.substr(1, rb - 1);
            if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                opts.port = hostPort.substr(rb + 2);
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080";
    }
    return opts;
}

std::unique_ptr<HTTPServer> HTTPServerFactory::Create(const std::string& config) {
    return std::make_unique<HTTPServer>(ParseOptions(config));
}

} // namespace hawkguard
