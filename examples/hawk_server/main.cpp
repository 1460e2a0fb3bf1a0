//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example HTTP server guarding routes with the Hawk Authorization / Server-Authorization guards
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "hawkguard/HTTPServer.hpp"
#include "hawkguard/auth/Guard.hpp"
#include "hawkguard/version.h"

using namespace hawkguard;
namespace http = boost::beast::http;

static std::atomic<bool> gStop{false};

static void onSignal(int) {
    gStop.store(true);
}

//==========================================================================================================
// Parses simple key=value style command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::string describeCredential(const hawk::HawkHeader& h) {
    std::string body = "{\"id\":\"" + h.id.value_or(std::string()) + "\"";
    if (h.ts) {
        body += ",\"ts\":" + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(h.ts->time_since_epoch()).count());
    }
    body += "}";
    return body;
}

int main(int argc, char** argv) {
    LOG_INFO("hawk_server {}", getVersionString());

    std::string listen = GetEnvOrDefault("HAWKGUARD_LISTEN", "http://127.0.0.1:8080");
    if (auto v = getArgValue(argc, argv, "--listen")) {
        listen = *v;
    }

    HTTPServerFactory factory;
    std::unique_ptr<HTTPServer> server;
    try {
        server = factory.Create(listen);
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid listen address '{}': {}", listen, e.what());
        return 1;
    }

    // Credential required; failures are answered with the guard's status
    server->Route(http::verb::get, "/whoami",
        RequireGuard<auth::AuthorizationHeader>([](const HTTPServer::Request& req, const auth::AuthorizationHeader& hawk) {
            return MakeJsonResponse(req, http::status::ok, describeCredential(*hawk));
        }));

    server->Route(http::verb::get, "/server-whoami",
        RequireGuard<auth::ServerAuthorizationHeader>([](const HTTPServer::Request& req, const auth::ServerAuthorizationHeader& hawk) {
            return MakeJsonResponse(req, http::status::ok, describeCredential(*hawk));
        }));

    // Credential optional; the handler inspects the outcome itself
    server->Route(http::verb::get, "/hello", [](const HTTPServer::Request& req) {
        auth::BeastRequestHeaders headers(req);
        auto outcome = auth::AuthorizationHeader::FromRequest(headers);
        if (outcome.Ok()) {
            return MakeJsonResponse(req, http::status::ok,
                                    "{\"hello\":\"" + outcome.Value()->id.value_or(std::string("anonymous")) + "\"}");
        }
        if (errors::IsNoHeader(outcome.Failure().error)) {
            return MakeJsonResponse(req, http::status::ok, "{\"hello\":\"anonymous\"}");
        }
        return MakeGuardFailureResponse(req, outcome.Failure());
    });

    try {
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start: {}", e.what());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Optional bounded run for scripted use
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (auto ms = getArgValue(argc, argv, "--duration-ms")) {
        try {
            deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::stol(*ms));
        } catch (const std::exception& e) {
            LOG_WARN("Ignoring --duration-ms={}: {}", *ms, e.what());
        }
    }

    while (!gStop.load()) {
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server->Stop().get();
    return 0;
}
