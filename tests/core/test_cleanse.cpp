// SEEDFORGE - Secret Wiping Tests
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include <gtest/gtest.h>
#include "seedforge/core/cleanse.h"
#include "seedforge/core/types.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace seedforge {
namespace test {

namespace {

template<typename Buffer>
bool AllZero(const Buffer& buffer) {
    return std::all_of(buffer.begin(), buffer.end(), [](Byte b) { return b == 0; });
}

} // namespace

TEST(CleanseTest, WipesAtScopeEnd) {
    std::array<Byte, 64> seed;
    seed.fill(0xA5);
    {
        CleanseOnExit<std::array<Byte, 64>> wipe(seed);
        EXPECT_EQ(seed[0], 0xA5);
    }
    EXPECT_TRUE(AllZero(seed));
}

TEST(CleanseTest, WipesBufferAssignedAfterGuard) {
    Bytes entropy;
    {
        CleanseOnExit<Bytes> wipe(entropy);
        entropy = Bytes(32, 0x7F);
    }
    ASSERT_EQ(entropy.size(), 32u);
    EXPECT_TRUE(AllZero(entropy));
}

TEST(CleanseTest, WipesWhenUnwinding) {
    Bytes entropy(16, 0xFF);
    try {
        CleanseOnExit<Bytes> wipe(entropy);
        throw std::runtime_error("derivation failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_TRUE(AllZero(entropy));
}

TEST(CleanseTest, EmptyBufferIsFine) {
    Bytes empty;
    {
        CleanseOnExit<Bytes> wipe(empty);
    }
    EXPECT_TRUE(empty.empty());
}

} // namespace test
} // namespace seedforge
