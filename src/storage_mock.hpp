#pragma once

#include <gmock/gmock.h>

#include "storage.hpp"

class StorageMock : public StorageInterface
{
public:
    ~StorageMock() override = default;

    MOCK_METHOD(E<void>, init, (), (override));
    MOCK_METHOD(E<void>, putSpace, (const std::string&, const std::string&,
                                    const std::string&), (override));
    MOCK_METHOD(E<Space>, getSpace, (const std::string&), (override));
    MOCK_METHOD(E<void>, deleteSpace, (const std::string&), (override));
    MOCK_METHOD(E<std::vector<Space>>, listSpaces, (const std::string&),
                (override));
    MOCK_METHOD(E<void>, putResource,
                (const std::string&, const std::string&, const std::string&,
                 const std::string&), (override));
    MOCK_METHOD(E<Resource>, getResource,
                (const std::string&, const std::string&), (override));
    MOCK_METHOD(E<void>, deleteResource,
                (const std::string&, const std::string&), (override));
};
