#include <doctest/doctest.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <vector>
#include "jwsign/secure_vector.hpp"

using namespace jwsign;

TEST_CASE("SecureAllocator: BasicAllocation") {
    SecureAllocator<uint8_t> allocator;

    auto ptr = allocator.allocate(1024);
    REQUIRE(ptr != nullptr);

    std::memset(ptr, 0xAA, 1024);
    CHECK(ptr[0] == 0xAA);
    CHECK(ptr[1023] == 0xAA);

    allocator.deallocate(ptr, 1024);
}

TEST_CASE("SecureAllocator: ZeroAllocation") {
    SecureAllocator<uint8_t> allocator;
    CHECK(allocator.allocate(0) == nullptr);
    allocator.deallocate(nullptr, 0);
}

TEST_CASE("SecureAllocator: Rebind") {
    using traits = std::allocator_traits<SecureAllocator<int>>;
    CHECK(std::is_same_v<traits::value_type, int>);
    CHECK(std::is_same_v<traits::rebind_alloc<char>, SecureAllocator<char>>);
}

TEST_CASE("SecureVector: Conversion from span") {
    std::vector<uint8_t> regular = {0x01, 0x02, 0x03, 0x04, 0x05};

    auto secure_vec = secure_utils::to_secure_vector(std::span<const uint8_t>(regular));
    REQUIRE(secure_vec.size() == 5);
    CHECK(std::equal(secure_vec.begin(), secure_vec.end(), regular.begin()));
}

TEST_CASE("SecureVector: Growth keeps contents") {
    SecureVector<uint8_t> vec = {0x42};
    vec.resize(5000, 0xFF);
    CHECK(vec[0] == 0x42);
    CHECK(vec[4999] == 0xFF);

    SecureVector<uint8_t> moved = std::move(vec);
    CHECK(moved.size() == 5000);
}

TEST_CASE("SecureUtils: ConstantTimeCompare") {
    uint8_t data1[] = {0x01, 0x02, 0x03, 0x04};
    uint8_t data2[] = {0x01, 0x02, 0x03, 0x04};
    uint8_t data3[] = {0x01, 0x02, 0x03, 0x05};

    CHECK(secure_utils::constantTimeCompare(data1, data2, 4) == 0);
    CHECK(secure_utils::constantTimeCompare(data1, data3, 4) != 0);
    CHECK(secure_utils::constantTimeCompare(data1, data2, 0) == 0);
}

TEST_CASE("SecureUtils: ConstantTimeEqual inspects every byte") {
    const std::vector<uint8_t> reference(64, 0x5A);

    // A single differing bit at any position, including the last, is seen
    for (size_t i = 0; i < reference.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto other = reference;
            other[i] ^= static_cast<uint8_t>(1u << bit);
            CHECK_FALSE(secure_utils::constantTimeEqual(reference, other));
        }
    }
    CHECK(secure_utils::constantTimeEqual(reference, reference));
}

TEST_CASE("SecureUtils: ConstantTimeEqual rejects length mismatch") {
    std::vector<uint8_t> full = {0x01, 0x02, 0x03, 0x04};
    std::vector<uint8_t> prefix = {0x01, 0x02, 0x03};
    std::vector<uint8_t> empty;

    CHECK_FALSE(secure_utils::constantTimeEqual(full, prefix));
    CHECK_FALSE(secure_utils::constantTimeEqual(prefix, full));
    CHECK_FALSE(secure_utils::constantTimeEqual(full, empty));
    CHECK(secure_utils::constantTimeEqual(empty, std::vector<uint8_t>{}));
}
