/**
 * @file test_uuid.cpp
 * @brief Unit tests for UUID generation
 */

#include <gtest/gtest.h>
#include <dmsd/utils/uuid.hpp>

#include <cctype>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace dmsd::utils;

TEST(UUIDTest, GeneratesValidFormat) {
    std::string uuid = UUIDGenerator::generate();

    // UUID format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (36 chars)
    EXPECT_EQ(uuid.length(), 36u);

    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');

    for (size_t i = 0; i < uuid.length(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(uuid[i])))
            << "Non-hex char at position " << i;
        EXPECT_FALSE(std::isupper(static_cast<unsigned char>(uuid[i])))
            << "Uppercase char at position " << i;
    }

    EXPECT_TRUE(UUIDGenerator::isValid(uuid));
}

TEST(UUIDTest, SetsVersionAndVariant) {
    for (int i = 0; i < 100; ++i) {
        std::string uuid = UUIDGenerator::generate();
        EXPECT_EQ(uuid[14], '4');
        char variant = uuid[19];
        EXPECT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b')
            << uuid;
    }
}

TEST(UUIDTest, GeneratesUniqueValues) {
    std::set<std::string> uuids;
    const int num_uuids = 1000;

    for (int i = 0; i < num_uuids; ++i) {
        uuids.insert(UUIDGenerator::generate());
    }

    EXPECT_EQ(uuids.size(), static_cast<size_t>(num_uuids));
}

TEST(UUIDTest, ThreadSafeGeneration) {
    std::set<std::string> uuids;
    std::mutex mtx;
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int per_thread = 100;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < per_thread; ++i) {
                std::string uuid = UUIDGenerator::generate();
                std::lock_guard<std::mutex> lock(mtx);
                uuids.insert(uuid);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(uuids.size(), static_cast<size_t>(num_threads * per_thread));
}

TEST(UUIDTest, FormatRendersBytesInOrder) {
    UUIDGenerator::Bytes bytes = {
        0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
        0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00,
    };
    EXPECT_EQ(UUIDGenerator::format(bytes), "550e8400-e29b-41d4-a716-446655440000");
}

TEST(UUIDTest, NilUUID) {
    EXPECT_EQ(UUIDGenerator::nil(), "00000000-0000-0000-0000-000000000000");
    EXPECT_TRUE(UUIDGenerator::isValid(UUIDGenerator::nil()));
}

TEST(UUIDTest, RejectsMalformed) {
    EXPECT_FALSE(UUIDGenerator::isValid(""));
    EXPECT_FALSE(UUIDGenerator::isValid("550e8400e29b41d4a716446655440000"));
    EXPECT_FALSE(UUIDGenerator::isValid("550e8400-e29b-41d4-a716-44665544000g"));
    EXPECT_FALSE(UUIDGenerator::isValid("550e8400-e29b-41d4-a716-4466554400000"));
}
