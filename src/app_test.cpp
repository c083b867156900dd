#include <memory>
#include <string>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "app.hpp"
#include "config.hpp"
#include "signing_test_utils.hpp"
#include "storage_memory.hpp"
#include "storage_mock.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr char SPACE_UUID[] = "test-uuid";

httplib::Request makeRequest(const std::string& method,
                             const std::string& path,
                             const std::string& body = "")
{
    httplib::Request req;
    req.method = method;
    req.path = path;
    req.body = body;
    return req;
}

std::string problemType(const httplib::Response& res)
{
    return nlohmann::json::parse(res.body)["type"].get<std::string>();
}

} // namespace

class AppTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto s = std::make_unique<MemoryStorage>();
        storage = s.get();
        app = std::make_unique<App>(Config(), std::move(s));
    }

    // PUT /space/{uuid} signed by “who”, with “controller” in the body.
    httplib::Response putSpace(TestSigner& who, const std::string& uuid,
                               const std::string& controller)
    {
        nlohmann::json body = {{"id", makeUrnUuid(uuid)},
                               {"controller", controller}};
        httplib::Request req = makeRequest("PUT", "/space/" + uuid,
                                           body.dump());
        who.sign(req);
        httplib::Response res;
        app->handlePutSpace(req, res, uuid);
        return res;
    }

    httplib::Response putResource(TestSigner& who, const std::string& uuid,
                                  const std::string& path,
                                  const std::string& content,
                                  const std::string& content_type)
    {
        httplib::Request req = makeRequest("PUT", "/space/" + uuid + path,
                                           content);
        if(!content_type.empty())
        {
            req.set_header("Content-Type", content_type);
        }
        who.sign(req);
        httplib::Response res;
        app->handlePutResource(req, res, uuid, path, 204);
        return res;
    }

    httplib::Response getResource(const std::string& uuid,
                                  const std::string& path)
    {
        httplib::Request req = makeRequest("GET", "/space/" + uuid + path);
        httplib::Response res;
        app->handleGetResource(req, res, uuid, path);
        return res;
    }

    TestSigner alice;
    TestSigner bob;
    MemoryStorage* storage;
    std::unique_ptr<App> app;
};

TEST_F(AppTest, CreateWriteReadScenario)
{
    EXPECT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    EXPECT_EQ(putResource(alice, SPACE_UUID, "/notes/hello.txt", "hello",
                          "text/plain").status, 204);

    // Bob may not write into Alice’s space.
    auto res = putResource(bob, SPACE_UUID, "/notes/hello.txt", "pwned",
                           "text/plain");
    EXPECT_EQ(res.status, 403);
    EXPECT_EQ(res.get_header_value("Content-Type"),
              "application/problem+json");
    EXPECT_EQ(problemType(res), "https://wallet.storage/spec#forbidden");

    // Anyone may read, unsigned.
    res = getResource(SPACE_UUID, "/notes/hello.txt");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "hello");
    EXPECT_EQ(res.get_header_value("Content-Type"), "text/plain");
}

TEST_F(AppTest, PutSpaceRequiresController)
{
    httplib::Request req = makeRequest("PUT", "/space/abc",
                                       R"({"id": "urn:uuid:abc"})");
    alice.sign(req);
    httplib::Response res;
    app->handlePutSpace(req, res, "abc");
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(problemType(res), "https://wallet.storage/spec#bad-request");
    EXPECT_THAT(res.body, HasSubstr("/body"));

    req = makeRequest("PUT", "/space/abc", "not json");
    alice.sign(req);
    res = httplib::Response();
    app->handlePutSpace(req, res, "abc");
    EXPECT_EQ(res.status, 400);
}

TEST_F(AppTest, PutSpaceDefaultsId)
{
    httplib::Request req = makeRequest(
        "PUT", "/space/abc",
        nlohmann::json({{"controller", alice.did}}).dump());
    alice.sign(req);
    httplib::Response res;
    app->handlePutSpace(req, res, "abc");
    EXPECT_EQ(res.status, 204);
    EXPECT_EQ(storage->getSpace("abc")->id, "urn:uuid:abc");
}

TEST_F(AppTest, PutSpaceForSomeoneElse)
{
    // The body names Bob, but Alice signed.
    auto res = putSpace(alice, SPACE_UUID, bob.did);
    EXPECT_EQ(res.status, 403);
    EXPECT_EQ(storage->getSpace(SPACE_UUID).error().code,
              ErrorCode::NOT_FOUND);
}

TEST_F(AppTest, TakeOverSpaceIsForbidden)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    EXPECT_EQ(putSpace(bob, SPACE_UUID, bob.did).status, 403);
    EXPECT_EQ(storage->getSpace(SPACE_UUID)->controller, alice.did);
}

TEST_F(AppTest, HandOverSpace)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    ASSERT_EQ(putSpace(alice, SPACE_UUID, bob.did).status, 204);
    EXPECT_EQ(storage->getSpace(SPACE_UUID)->controller, bob.did);

    httplib::Request req = makeRequest("GET", "/space/test-uuid");
    bob.sign(req);
    httplib::Response res;
    app->handleGetSpace(req, res, SPACE_UUID);
    EXPECT_EQ(res.status, 200);

    httplib::Request old_req = makeRequest("GET", "/space/test-uuid");
    alice.sign(old_req);
    httplib::Response old_res;
    app->handleGetSpace(old_req, old_res, SPACE_UUID);
    EXPECT_EQ(old_res.status, 403);

    // Alice has given up control, so she cannot take it back.
    EXPECT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 403);
}

TEST_F(AppTest, UnsignedWriteIsUnauthorized)
{
    httplib::Request req = makeRequest(
        "PUT", "/space/abc",
        nlohmann::json({{"controller", alice.did}}).dump());
    httplib::Response res;
    app->handlePutSpace(req, res, "abc");
    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(problemType(res), "https://wallet.storage/spec#unauthorized");
    EXPECT_THAT(res.body, HasSubstr("/authorization"));
}

TEST_F(AppTest, TamperedRequestIsUnauthorized)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    httplib::Request req = makeRequest("DELETE", "/space/" +
                                       std::string(SPACE_UUID) + "/a");
    alice.sign(req);
    req.method = "PUT";
    httplib::Response res;
    app->handlePutResource(req, res, SPACE_UUID, "/a", 204);
    EXPECT_EQ(res.status, 401);
}

TEST_F(AppTest, GetSpace)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);

    httplib::Request req = makeRequest("GET", "/space/test-uuid");
    alice.sign(req);
    httplib::Response res;
    app->handleGetSpace(req, res, SPACE_UUID);
    ASSERT_EQ(res.status, 200);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["id"], "urn:uuid:test-uuid");
    EXPECT_EQ(body["controller"], alice.did);

    req = makeRequest("GET", "/space/test-uuid");
    bob.sign(req);
    res = httplib::Response();
    app->handleGetSpace(req, res, SPACE_UUID);
    EXPECT_EQ(res.status, 403);

    req = makeRequest("GET", "/space/nothing");
    alice.sign(req);
    res = httplib::Response();
    app->handleGetSpace(req, res, "nothing");
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(problemType(res), "https://wallet.storage/spec#not-found");
}

TEST_F(AppTest, DeleteSpace)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    ASSERT_EQ(putResource(alice, SPACE_UUID, "/a", "1", "").status, 204);

    httplib::Request req = makeRequest("DELETE", "/space/test-uuid");
    bob.sign(req);
    httplib::Response res;
    app->handleDeleteSpace(req, res, SPACE_UUID);
    EXPECT_EQ(res.status, 403);

    req = makeRequest("DELETE", "/space/test-uuid");
    alice.sign(req);
    res = httplib::Response();
    app->handleDeleteSpace(req, res, SPACE_UUID);
    EXPECT_EQ(res.status, 204);
    EXPECT_EQ(getResource(SPACE_UUID, "/a").status, 404);

    // Already gone
    res = httplib::Response();
    app->handleDeleteSpace(req, res, SPACE_UUID);
    EXPECT_EQ(res.status, 204);
}

TEST_F(AppTest, CreateAndListSpaces)
{
    httplib::Request req = makeRequest("POST", "/spaces/");
    alice.sign(req);
    httplib::Response res;
    app->handleCreateSpace(req, res);
    ASSERT_EQ(res.status, 201);
    std::string location = res.get_header_value("Location");
    ASSERT_TRUE(location.starts_with("/space/"));
    std::string uuid = location.substr(7);
    EXPECT_TRUE(isUrnUuid(makeUrnUuid(uuid)));
    ASSERT_EQ(putSpace(bob, "bobs-space", bob.did).status, 204);

    req = makeRequest("GET", "/spaces/");
    alice.sign(req);
    res = httplib::Response();
    app->handleListSpaces(req, res);
    ASSERT_EQ(res.status, 200);
    auto body = nlohmann::json::parse(res.body);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["id"], makeUrnUuid(uuid));
    EXPECT_EQ(body[0]["controller"], alice.did);

    req = makeRequest("GET", "/spaces/");
    res = httplib::Response();
    app->handleListSpaces(req, res);
    EXPECT_EQ(res.status, 401);
}

TEST_F(AppTest, ResourceDefaults)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    ASSERT_EQ(putResource(alice, SPACE_UUID, "/blob", std::string("\0\1", 2),
                          "").status, 204);
    auto res = getResource(SPACE_UUID, "/blob");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, std::string("\0\1", 2));
    EXPECT_EQ(res.get_header_value("Content-Type"), DEFAULT_CONTENT_TYPE);
}

TEST_F(AppTest, PostResourceIsCreated)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    httplib::Request req = makeRequest("POST", "/space/test-uuid/new",
                                       R"({"a": 1})");
    req.set_header("Content-Type", "application/json");
    alice.sign(req);
    httplib::Response res;
    app->handlePutResource(req, res, SPACE_UUID, "/new", 201);
    EXPECT_EQ(res.status, 201);
    EXPECT_EQ(getResource(SPACE_UUID, "/new").body, R"({"a": 1})");
}

TEST_F(AppTest, WriteToMissingSpace)
{
    auto res = putResource(alice, "nothing", "/a", "1", "text/plain");
    EXPECT_EQ(res.status, 404);
    EXPECT_THAT(res.body, HasSubstr("/space"));
}

TEST_F(AppTest, MissingResource)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    auto res = getResource(SPACE_UUID, "/nothing");
    EXPECT_EQ(res.status, 404);
    EXPECT_THAT(res.body, HasSubstr("/resource"));
    EXPECT_EQ(getResource("nothing", "/nothing").status, 404);
}

TEST_F(AppTest, DeleteResource)
{
    ASSERT_EQ(putSpace(alice, SPACE_UUID, alice.did).status, 204);
    ASSERT_EQ(putResource(alice, SPACE_UUID, "/a", "1", "").status, 204);

    httplib::Request req = makeRequest("DELETE", "/space/test-uuid/a");
    bob.sign(req);
    httplib::Response res;
    app->handleDeleteResource(req, res, SPACE_UUID, "/a");
    EXPECT_EQ(res.status, 403);
    EXPECT_EQ(getResource(SPACE_UUID, "/a").status, 200);

    req = makeRequest("DELETE", "/space/test-uuid/a");
    alice.sign(req);
    for(int i = 0; i < 2; i++)
    {
        res = httplib::Response();
        app->handleDeleteResource(req, res, SPACE_UUID, "/a");
        EXPECT_EQ(res.status, 204);
    }
    EXPECT_EQ(getResource(SPACE_UUID, "/a").status, 404);
}

TEST(AppBackendTest, BackendFailureIsServiceUnavailable)
{
    auto s = std::make_unique<NiceMock<StorageMock>>();
    EXPECT_CALL(*s, getResource(_, _))
        .WillOnce(Return(std::unexpected(backendError("disk on fire"))));
    App app(Config(), std::move(s));

    httplib::Request req;
    req.method = "GET";
    req.path = "/space/abc/x";
    httplib::Response res;
    app.handleGetResource(req, res, "abc", "/x");
    EXPECT_EQ(res.status, 503);
    EXPECT_EQ(problemType(res),
              "https://wallet.storage/spec#service-unavailable");
}

TEST(AppServerTest, Routes)
{
    Config config;
    config.listen_address = "127.0.0.1";
    config.port = 18080;
    App app(config, std::make_unique<MemoryStorage>());
    std::thread server([&]() { app.start(); });
    app.waitUntilReady();

    TestSigner alice;
    httplib::Client client("127.0.0.1", 18080);
    {
        httplib::Request req;
        req.method = "PUT";
        req.path = "/space/routed";
        httplib::Headers headers = {
            {"Authorization", alice.authorization(req)}};
        auto res = client.Put(
            "/space/routed", headers,
            nlohmann::json({{"controller", alice.did}}).dump(),
            "application/json");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 204);
    }
    {
        httplib::Request req;
        req.method = "PUT";
        req.path = "/space/routed/deep/file.txt";
        httplib::Headers headers = {
            {"Authorization", alice.authorization(req)}};
        auto res = client.Put("/space/routed/deep/file.txt", headers,
                              "content", "text/plain");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 204);
    }
    {
        auto res = client.Get("/space/routed/deep/file.txt");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(res->body, "content");
        EXPECT_EQ(res->get_header_value("Content-Type"), "text/plain");
    }
    {
        httplib::Request req;
        req.method = "GET";
        req.path = "/spaces/";
        httplib::Headers headers = {
            {"Authorization", alice.authorization(req)}};
        auto res = client.Get("/spaces/", headers);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(nlohmann::json::parse(res->body).size(), 1u);
    }

    app.stop();
    server.join();
}
