#include <cctype>
#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "authorization.hpp"
#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

#define _ASSIGN_OR_RESPOND_ERROR(tmp, var, val, res, pointer)          \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        respondError(tmp.error(), res, pointer);                        \
        return;                                                         \
    }                                                                   \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RESPOND_ERROR(var, val, res, pointer)                 \
    _ASSIGN_OR_RESPOND_ERROR(_CONCAT_NAMES(assign_or_return_tmp, __COUNTER__), \
                             var, val, res, pointer)

#define _DO_OR_RESPOND_ERROR(tmp, val, res, pointer)                    \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        respondError(tmp.error(), res, pointer);                        \
        return;                                                         \
    }

#define DO_OR_RESPOND_ERROR(val, res, pointer)                          \
    _DO_OR_RESPOND_ERROR(_CONCAT_NAMES(do_or_return_tmp, __COUNTER__),  \
                         val, res, pointer)

namespace {

constexpr char CONTENT_TYPE_JSON[] = "application/json";
constexpr char CONTENT_TYPE_PROBLEM[] = "application/problem+json";
constexpr char PROBLEM_TYPE_PREFIX[] = "https://wallet.storage/spec#";

constexpr char POINTER_AUTH[] = "/authorization";
constexpr char POINTER_BODY[] = "/body";
constexpr char POINTER_SPACE[] = "/space";
constexpr char POINTER_RESOURCE[] = "/resource";

std::string_view problemTitle(int status)
{
    switch(status)
    {
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 503:
        return "Service Unavailable";
    }
    return "Internal Server Error";
}

// “Not Found” → “not-found”
std::string problemSlug(std::string_view title)
{
    std::string slug;
    for(char c : title)
    {
        slug.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(c)));
    }
    return slug;
}

nlohmann::json spaceToJson(const Space& space)
{
    return {{"id", space.id}, {"controller", space.controller}};
}

bool isNotFound(const Error& e)
{
    return e.code == ErrorCode::NOT_FOUND;
}

} // namespace

void respondError(const Error& e, httplib::Response& res,
                  std::string_view pointer)
{
    res.status = httpStatus(e.code);
    if(res.status >= 500)
    {
        spdlog::error("{}", errorMsg(e));
    }
    else
    {
        spdlog::debug("Rejecting request with {}: {}", res.status,
                      errorMsg(e));
    }

    const std::string title(problemTitle(res.status));
    nlohmann::json problem = {
        {"type", PROBLEM_TYPE_PREFIX + problemSlug(title)},
        {"title", title},
        {"errors", nlohmann::json::array({
                {{"detail", e.msg}, {"pointer", pointer}}})},
    };
    res.set_content(problem.dump(), CONTENT_TYPE_PROBLEM);
}

App::App(const Config& conf, std::unique_ptr<StorageInterface> storage_backend)
        : config(conf), storage(std::move(storage_backend)),
          verifier(std::chrono::seconds(conf.clock_skew_seconds)),
          authorizer(*storage)
{
}

void App::handlePutSpace(const httplib::Request& req, httplib::Response& res,
                         const std::string& space_uuid)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);

    nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
    if(body.is_discarded() || !body.is_object())
    {
        respondError(makeError(ErrorCode::INVALID_REQUEST,
                               "Body must be a JSON object"),
                     res, POINTER_BODY);
        return;
    }
    if(!body.contains("controller") || !body["controller"].is_string() ||
       body["controller"].get<std::string>().empty())
    {
        respondError(makeError(ErrorCode::INVALID_REQUEST,
                               "Body must include a 'controller'"),
                     res, POINTER_BODY);
        return;
    }
    std::string controller = body["controller"].get<std::string>();

    std::string id = makeUrnUuid(space_uuid);
    if(body.contains("id"))
    {
        if(!body["id"].is_string())
        {
            respondError(makeError(ErrorCode::INVALID_REQUEST,
                                   "'id' must be a string"),
                         res, POINTER_BODY);
            return;
        }
        id = body["id"].get<std::string>();
    }

    ASSIGN_OR_RESPOND_ERROR(
        AuthDecision decision,
        authorizer.authorize(Operation::SPACE_PUT, signer, space_uuid),
        res, POINTER_AUTH);
    // The current controller may hand the space over, but nobody can
    // create a space on someone else's behalf.
    if(decision.creating && controller != signer)
    {
        respondError(makeError(ErrorCode::FORBIDDEN,
                               "Signer does not match space controller"),
                     res, POINTER_AUTH);
        return;
    }
    DO_OR_RESPOND_ERROR(storage->putSpace(space_uuid, id, controller), res,
                        POINTER_SPACE);
    if(decision.creating)
    {
        spdlog::info("Created space {} for {}", space_uuid, controller);
    }
    res.status = 204;
}

void App::handleGetSpace(const httplib::Request& req, httplib::Response& res,
                         const std::string& space_uuid)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);
    auto decision = authorizer.authorize(Operation::SPACE_GET, signer,
                                         space_uuid);
    if(!decision.has_value())
    {
        respondError(decision.error(), res,
                     isNotFound(decision.error()) ? POINTER_SPACE :
                     POINTER_AUTH);
        return;
    }
    res.set_content(spaceToJson(*decision->space).dump(), CONTENT_TYPE_JSON);
}

void App::handleDeleteSpace(const httplib::Request& req,
                            httplib::Response& res,
                            const std::string& space_uuid)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);
    auto decision = authorizer.authorize(Operation::SPACE_DELETE, signer,
                                         space_uuid);
    if(!decision.has_value())
    {
        // Deleting something that is not there is already done.
        if(!isNotFound(decision.error()))
        {
            respondError(decision.error(), res, POINTER_AUTH);
            return;
        }
    }
    else
    {
        auto result = storage->deleteSpace(space_uuid);
        if(!result.has_value() && !isNotFound(result.error()))
        {
            respondError(result.error(), res, POINTER_SPACE);
            return;
        }
        spdlog::info("Deleted space {}", space_uuid);
    }
    res.status = 204;
}

void App::handleCreateSpace(const httplib::Request& req,
                            httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);
    const std::string space_uuid = generateUuid();
    DO_OR_RESPOND_ERROR(storage->putSpace(space_uuid, makeUrnUuid(space_uuid),
                                          signer),
                        res, POINTER_SPACE);
    spdlog::info("Created space {} for {}", space_uuid, signer);
    res.status = 201;
    res.set_header("Location", std::format("/space/{}", space_uuid));
}

void App::handleListSpaces(const httplib::Request& req, httplib::Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);
    DO_OR_RESPOND_ERROR(authorizer.authorize(Operation::SPACE_LIST, signer, ""),
                        res, POINTER_AUTH);
    ASSIGN_OR_RESPOND_ERROR(std::vector<Space> spaces,
                            storage->listSpaces(signer), res, POINTER_SPACE);
    nlohmann::json items = nlohmann::json::array();
    for(const Space& space : spaces)
    {
        items.push_back(spaceToJson(space));
    }
    res.set_content(items.dump(), CONTENT_TYPE_JSON);
}

void App::handleGetResource(const httplib::Request&, httplib::Response& res,
                            const std::string& space_uuid,
                            const std::string& path)
{
    DO_OR_RESPOND_ERROR(authorizer.authorize(Operation::RESOURCE_GET,
                                             std::nullopt, space_uuid),
                        res, POINTER_AUTH);
    ASSIGN_OR_RESPOND_ERROR(Resource resource,
                            storage->getResource(space_uuid, path),
                            res, POINTER_RESOURCE);
    res.set_content(resource.content, resource.content_type);
}

void App::handlePutResource(const httplib::Request& req,
                            httplib::Response& res,
                            const std::string& space_uuid,
                            const std::string& path, int success_status)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);
    auto decision = authorizer.authorize(Operation::RESOURCE_PUT, signer,
                                         space_uuid);
    if(!decision.has_value())
    {
        respondError(decision.error(), res,
                     isNotFound(decision.error()) ? POINTER_SPACE :
                     POINTER_AUTH);
        return;
    }

    std::string content_type = req.get_header_value("Content-Type");
    if(content_type.empty())
    {
        content_type = DEFAULT_CONTENT_TYPE;
    }
    DO_OR_RESPOND_ERROR(storage->putResource(space_uuid, path, req.body,
                                             content_type),
                        res, POINTER_RESOURCE);
    res.status = success_status;
}

void App::handleDeleteResource(const httplib::Request& req,
                               httplib::Response& res,
                               const std::string& space_uuid,
                               const std::string& path)
{
    ASSIGN_OR_RESPOND_ERROR(std::string signer, verifier.verify(req), res,
                            POINTER_AUTH);
    auto decision = authorizer.authorize(Operation::RESOURCE_DELETE, signer,
                                         space_uuid);
    if(!decision.has_value())
    {
        if(!isNotFound(decision.error()))
        {
            respondError(decision.error(), res, POINTER_AUTH);
            return;
        }
    }
    else
    {
        auto result = storage->deleteResource(space_uuid, path);
        if(!result.has_value() && !isNotFound(result.error()))
        {
            respondError(result.error(), res, POINTER_RESOURCE);
            return;
        }
    }
    res.status = 204;
}

void App::setupRoutes()
{
    server.set_logger([](const httplib::Request& req,
                         const httplib::Response& res)
    {
        spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });

    server.Get(R"(/spaces/?)", [&](const httplib::Request& req,
                                   httplib::Response& res)
    {
        handleListSpaces(req, res);
    });

    server.Post(R"(/spaces/?)", [&](const httplib::Request& req,
                                    httplib::Response& res)
    {
        handleCreateSpace(req, res);
    });

    server.Put(R"(/space/([^/]+))", [&](const httplib::Request& req,
                                        httplib::Response& res)
    {
        handlePutSpace(req, res, req.matches[1]);
    });

    server.Get(R"(/space/([^/]+))", [&](const httplib::Request& req,
                                        httplib::Response& res)
    {
        handleGetSpace(req, res, req.matches[1]);
    });

    server.Delete(R"(/space/([^/]+))", [&](const httplib::Request& req,
                                           httplib::Response& res)
    {
        handleDeleteSpace(req, res, req.matches[1]);
    });

    // The second group keeps its leading slash, which makes it the
    // resource path.
    server.Get(R"(/space/([^/]+)(/.+))", [&](const httplib::Request& req,
                                             httplib::Response& res)
    {
        handleGetResource(req, res, req.matches[1], req.matches[2]);
    });

    server.Put(R"(/space/([^/]+)(/.+))", [&](const httplib::Request& req,
                                             httplib::Response& res)
    {
        handlePutResource(req, res, req.matches[1], req.matches[2], 204);
    });

    server.Post(R"(/space/([^/]+)(/.+))", [&](const httplib::Request& req,
                                              httplib::Response& res)
    {
        handlePutResource(req, res, req.matches[1], req.matches[2], 201);
    });

    server.Delete(R"(/space/([^/]+)(/.+))", [&](const httplib::Request& req,
                                                httplib::Response& res)
    {
        handleDeleteResource(req, res, req.matches[1], req.matches[2]);
    });
}

bool App::start()
{
    setupRoutes();
    spdlog::info("Listening at http://{}:{}/...", config.listen_address,
                 config.port);
    if(!server.listen(config.listen_address, config.port))
    {
        spdlog::error("Failed to listen at {}:{}", config.listen_address,
                      config.port);
        return false;
    }
    return true;
}

void App::stop()
{
    server.stop();
}

void App::waitUntilReady()
{
    server.wait_until_ready();
}
