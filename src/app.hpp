#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <httplib.h>

#include "authorization.hpp"
#include "config.hpp"
#include "error.hpp"
#include "signature_verifier.hpp"
#include "storage.hpp"

constexpr char DEFAULT_CONTENT_TYPE[] = "application/octet-stream";

class App
{
public:
    App() = delete;
    App(const Config& conf, std::unique_ptr<StorageInterface> storage);

    // Space APIs
    void handlePutSpace(const httplib::Request& req, httplib::Response& res,
                        const std::string& space_uuid);
    void handleGetSpace(const httplib::Request& req, httplib::Response& res,
                        const std::string& space_uuid);
    void handleDeleteSpace(const httplib::Request& req, httplib::Response& res,
                           const std::string& space_uuid);
    void handleCreateSpace(const httplib::Request& req, httplib::Response& res);
    void handleListSpaces(const httplib::Request& req, httplib::Response& res);

    // Resource APIs. “path” always starts with “/”.
    void handleGetResource(const httplib::Request& req, httplib::Response& res,
                           const std::string& space_uuid,
                           const std::string& path);
    // PUT answers 204 and POST answers 201; otherwise they are the same
    // upsert.
    void handlePutResource(const httplib::Request& req, httplib::Response& res,
                           const std::string& space_uuid,
                           const std::string& path, int success_status);
    void handleDeleteResource(const httplib::Request& req,
                              httplib::Response& res,
                              const std::string& space_uuid,
                              const std::string& path);

    // Blocks until stop() is called. Returns false if the server could
    // not listen.
    bool start();
    void stop();
    void waitUntilReady();

private:
    void setupRoutes();

    const Config config;
    std::unique_ptr<StorageInterface> storage;
    SignatureVerifier verifier;
    Authorizer authorizer;
    httplib::Server server;
};

// Fill in “res” as an application/problem+json response for “e”.
// “pointer” names the part of the request the error is about.
void respondError(const Error& e, httplib::Response& res,
                  std::string_view pointer);
