#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "authorization.hpp"
#include "storage_mock.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr char ALICE[] = "did:key:z6MkAlice";
constexpr char BOB[] = "did:key:z6MkBob";
constexpr char SPACE_UUID[] = "test-uuid";

Space aliceSpace()
{
    return Space{SPACE_UUID, makeUrnUuid(SPACE_UUID), ALICE};
}

} // namespace

class AuthorizerTest : public ::testing::Test
{
protected:
    NiceMock<StorageMock> storage;
    Authorizer authorizer{storage};
};

TEST_F(AuthorizerTest, ResourceReadNeedsNothing)
{
    EXPECT_CALL(storage, getSpace(_)).Times(0);
    auto decision = authorizer.authorize(Operation::RESOURCE_GET, std::nullopt,
                                         SPACE_UUID);
    ASSERT_TRUE(decision.has_value());
    EXPECT_FALSE(decision->creating);
}

TEST_F(AuthorizerTest, UnsignedWriteIsRejected)
{
    for(Operation op : {Operation::SPACE_PUT, Operation::SPACE_GET,
                        Operation::SPACE_DELETE, Operation::SPACE_LIST,
                        Operation::RESOURCE_PUT, Operation::RESOURCE_DELETE})
    {
        auto decision = authorizer.authorize(op, std::nullopt, SPACE_UUID);
        ASSERT_FALSE(decision.has_value());
        EXPECT_EQ(decision.error().code, ErrorCode::UNAUTHENTICATED);
    }
}

TEST_F(AuthorizerTest, ListNeedsOnlyASigner)
{
    EXPECT_CALL(storage, getSpace(_)).Times(0);
    EXPECT_TRUE(authorizer.authorize(Operation::SPACE_LIST, BOB, ""));
}

TEST_F(AuthorizerTest, PutOnMissingSpaceCreates)
{
    EXPECT_CALL(storage, getSpace(SPACE_UUID))
        .WillOnce(Return(std::unexpected(notFound("no such space"))));
    auto decision = authorizer.authorize(Operation::SPACE_PUT, ALICE,
                                         SPACE_UUID);
    ASSERT_TRUE(decision.has_value());
    EXPECT_TRUE(decision->creating);
    EXPECT_FALSE(decision->space.has_value());
}

TEST_F(AuthorizerTest, ControllerIsAllowed)
{
    EXPECT_CALL(storage, getSpace(SPACE_UUID))
        .WillRepeatedly(Return(aliceSpace()));
    for(Operation op : {Operation::SPACE_PUT, Operation::SPACE_GET,
                        Operation::SPACE_DELETE, Operation::RESOURCE_PUT,
                        Operation::RESOURCE_DELETE})
    {
        auto decision = authorizer.authorize(op, ALICE, SPACE_UUID);
        ASSERT_TRUE(decision.has_value());
        EXPECT_FALSE(decision->creating);
        EXPECT_EQ(decision->space, aliceSpace());
    }
}

TEST_F(AuthorizerTest, OtherSignerIsForbidden)
{
    EXPECT_CALL(storage, getSpace(SPACE_UUID))
        .WillRepeatedly(Return(aliceSpace()));
    for(Operation op : {Operation::SPACE_PUT, Operation::SPACE_GET,
                        Operation::SPACE_DELETE, Operation::RESOURCE_PUT,
                        Operation::RESOURCE_DELETE})
    {
        auto decision = authorizer.authorize(op, BOB, SPACE_UUID);
        ASSERT_FALSE(decision.has_value());
        EXPECT_EQ(decision.error().code, ErrorCode::FORBIDDEN);
    }
}

TEST_F(AuthorizerTest, MissingSpaceIsNotFound)
{
    EXPECT_CALL(storage, getSpace(SPACE_UUID))
        .WillRepeatedly(Return(std::unexpected(notFound("no such space"))));
    for(Operation op : {Operation::SPACE_GET, Operation::SPACE_DELETE,
                        Operation::RESOURCE_PUT, Operation::RESOURCE_DELETE})
    {
        auto decision = authorizer.authorize(op, ALICE, SPACE_UUID);
        ASSERT_FALSE(decision.has_value());
        EXPECT_EQ(decision.error().code, ErrorCode::NOT_FOUND);
    }
}

TEST_F(AuthorizerTest, BackendFailurePropagates)
{
    EXPECT_CALL(storage, getSpace(SPACE_UUID))
        .WillRepeatedly(Return(std::unexpected(backendError("disk on fire"))));
    auto decision = authorizer.authorize(Operation::SPACE_PUT, ALICE,
                                         SPACE_UUID);
    ASSERT_FALSE(decision.has_value());
    EXPECT_EQ(decision.error().code, ErrorCode::BACKEND_UNAVAILABLE);
}
