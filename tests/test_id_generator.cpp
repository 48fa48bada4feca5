// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <augsweep/id_generator.h>

#include <set>

using namespace augsweep;

TEST(IdGeneratorTest, RandomBytesLength) {
    EXPECT_EQ(randomBytes(0).size(), 0u);
    EXPECT_EQ(randomBytes(16).size(), 16u);
}

TEST(IdGeneratorTest, RandomHexIsLowercase) {
    std::string hex = randomHex(20);
    ASSERT_EQ(hex.size(), 40u);
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << hex;
    }
}

TEST(IdGeneratorTest, UuidV4Format) {
    for (int i = 0; i < 50; ++i) {
        std::string id = generateUuidV4();
        EXPECT_TRUE(isUuidV4(id)) << id;
        EXPECT_EQ(id[14], '4');
    }
}

TEST(IdGeneratorTest, MachineIdFormat) {
    std::string id = generateMachineId();
    EXPECT_EQ(id.size(), 64u);
    EXPECT_TRUE(isMachineId(id));
}

TEST(IdGeneratorTest, IdsAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(generateUuidV4());
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(IdGeneratorTest, RejectsMalformedIds) {
    EXPECT_FALSE(isUuidV4(""));
    EXPECT_FALSE(isUuidV4("123e4567-e89b-12d3-a456-426614174000")); // version 1
    EXPECT_FALSE(isUuidV4("123E4567-E89B-42D3-A456-426614174000")); // uppercase
    EXPECT_FALSE(isUuidV4("123e4567-e89b-42d3-c456-426614174000")); // bad variant
    EXPECT_TRUE(isUuidV4("123e4567-e89b-42d3-a456-426614174000"));

    EXPECT_FALSE(isMachineId(std::string(63, 'a')));
    EXPECT_FALSE(isMachineId(std::string(64, 'g')));
    EXPECT_TRUE(isMachineId(std::string(64, 'f')));
}
