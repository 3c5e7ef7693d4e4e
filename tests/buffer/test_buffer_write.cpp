#include <array>
#include <cstdint>
#include <iostream>
#include <span>
#include <vector>

#include "embytes/buffer.hpp"

#include "common/bytes.hpp"
#include "common/test_check.hpp"

using namespace embytes;

/*
================================================================================
Buffer Write Path - Unit Tests
================================================================================

Covers write(), write_all() and push():

  • write() copies min(len, free) bytes and reports the count
  • A short write is success, a full buffer reports 0
  • write_all() keeps partial progress and fails with OutOfCapacity
  • push() is all-or-nothing
  • The same semantics hold for every storage flavour
================================================================================
*/

// Storage exposing explicit views instead of being a byte range
struct DmaWindow {
    std::array<std::uint8_t, 16> bytes{};

    std::span<std::uint8_t> as_mut() noexcept { return bytes; }
    std::span<const std::uint8_t> as_ref() const noexcept { return bytes; }
};

static_assert(ByteStorage<storage::stack<8>>);
static_assert(ByteStorage<std::vector<std::uint8_t>>);
static_assert(ByteStorage<std::span<std::uint8_t>>);
static_assert(ByteStorage<DmaWindow>);
static_assert(!ByteStorage<std::span<const std::uint8_t>>);
static_assert(!ByteStorage<std::vector<char>>);

// ============================================================================
// write()
// ============================================================================

void test_write_fits() {
    std::cout << "[TEST] write() with enough capacity..." << std::endl;

    std::array<std::uint8_t, 8> bytes{};
    Buffer buffer{std::span<std::uint8_t>(bytes)};

    const std::array<std::uint8_t, 3> src{3, 4, 5};
    TEST_CHECK(buffer.write(src) == 3);
    TEST_CHECK(buffer.read_position() == 0);
    TEST_CHECK(buffer.write_position() == 3);
    TEST_CHECK(buffer.remaining_capacity() == 5);

    // Borrowed storage sees the bytes in place
    TEST_CHECK(test::bytes_equal(bytes, {3, 4, 5, 0, 0, 0, 0, 0}));

    std::cout << "[TEST] OK\n";
}

void test_write_short() {
    std::cout << "[TEST] write() larger than capacity is truncated..." << std::endl;

    std::array<std::uint8_t, 4> bytes{};
    Buffer buffer{std::span<std::uint8_t>(bytes)};

    const std::array<std::uint8_t, 6> src{1, 2, 3, 4, 5, 6};
    TEST_CHECK(buffer.write(src) == 4);
    TEST_CHECK(buffer.write_position() == 4);
    TEST_CHECK(!buffer.has_remaining_capacity());
    TEST_CHECK(test::bytes_equal(bytes, {1, 2, 3, 4}));

    // Full: any further non-empty write reports 0
    TEST_CHECK(buffer.write(src) == 0);
    TEST_CHECK(buffer.write("x") == 0);
    TEST_CHECK(buffer.write_position() == 4);

    std::cout << "[TEST] OK\n";
}

void test_write_multiple() {
    std::cout << "[TEST] write() single bytes append in order..." << std::endl;

    auto buffer = make_stack_buffer<4>();

    for (std::uint8_t i = 0; i < 4; ++i) {
        const std::array<std::uint8_t, 1> one{i};
        TEST_CHECK(buffer.write(one) == 1);
    }
    TEST_CHECK(test::bytes_equal(buffer.data(), {0, 1, 2, 3}));
    TEST_CHECK(test::cursors_valid(buffer));

    std::cout << "[TEST] OK\n";
}

void test_write_empty_source() {
    std::cout << "[TEST] write() of an empty source mutates nothing..." << std::endl;

    auto buffer = make_stack_buffer<8>();
    TEST_CHECK(buffer.write("ab") == 2);

    TEST_CHECK(buffer.write(std::span<const std::uint8_t>{}) == 0);
    TEST_CHECK(buffer.write("") == 0);
    TEST_CHECK(buffer.write_position() == 2);
    TEST_CHECK(buffer.read_position() == 0);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// write_all()
// ============================================================================

void test_write_all_fits() {
    std::cout << "[TEST] write_all() within free capacity..." << std::endl;

    auto buffer = make_stack_buffer<16>();
    TEST_CHECK(buffer.write("abc") == 3);

    TEST_CHECK(buffer.write_all("defgh") == Error::None);
    TEST_CHECK(buffer.write_position() == 8);
    TEST_CHECK(test::equals(buffer.data(), "abcdefgh"));

    std::cout << "[TEST] OK\n";
}

void test_write_all_overflow_keeps_progress() {
    std::cout << "[TEST] write_all() beyond capacity fails and keeps partial progress..." << std::endl;

    auto buffer = make_stack_buffer<6>();
    TEST_CHECK(buffer.write("ab") == 2);

    TEST_CHECK(buffer.write_all("cdefgh") == Error::OutOfCapacity);
    // Advanced by exactly the free capacity, no rollback
    TEST_CHECK(buffer.write_position() == 6);
    TEST_CHECK(test::equals(buffer.data(), "abcdef"));

    std::cout << "[TEST] OK\n";
}

void test_write_all_empty() {
    std::cout << "[TEST] write_all() of nothing always succeeds..." << std::endl;

    auto buffer = make_stack_buffer<2>();
    TEST_CHECK(buffer.write("xy") == 2);
    TEST_CHECK(buffer.write_all(std::span<const std::uint8_t>{}) == Error::None);
    TEST_CHECK(buffer.write_position() == 2);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// push()
// ============================================================================

void test_push_all_or_nothing() {
    std::cout << "[TEST] push() is all-or-nothing..." << std::endl;

    auto buffer = make_stack_buffer<5>();

    TEST_CHECK(buffer.push("abc") == Error::None);
    TEST_CHECK(buffer.write_position() == 3);

    // 3 bytes do not fit in 2: nothing is copied
    TEST_CHECK(buffer.push("def") == Error::OutOfCapacity);
    TEST_CHECK(buffer.write_position() == 3);
    TEST_CHECK(test::equals(buffer.data(), "abc"));

    TEST_CHECK(buffer.push("de") == Error::None);
    TEST_CHECK(test::equals(buffer.data(), "abcde"));

    // Empty push fits even in a full buffer
    TEST_CHECK(buffer.push("") == Error::None);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// Storage flavours
// ============================================================================

void test_heap_storage() {
    std::cout << "[TEST] std::vector storage..." << std::endl;

    Buffer buffer(std::vector<std::uint8_t>(1024));
    TEST_CHECK(buffer.capacity() == 1024);
    TEST_CHECK(buffer.write_all("\x01\x02\x03\x04") == Error::None);
    TEST_CHECK(test::bytes_equal(buffer.data(), {1, 2, 3, 4}));

    // An empty vector is a zero-capacity buffer: it never grows
    Buffer empty(std::vector<std::uint8_t>{});
    TEST_CHECK(empty.capacity() == 0);
    TEST_CHECK(empty.write_all("\x01\x02\x03\x04") == Error::OutOfCapacity);

    std::cout << "[TEST] OK\n";
}

void test_member_view_storage() {
    std::cout << "[TEST] storage with as_mut()/as_ref()..." << std::endl;

    Buffer buffer(DmaWindow{});
    TEST_CHECK(buffer.capacity() == 16);
    TEST_CHECK(buffer.write("0123456789abcdefXYZ") == 16);
    TEST_CHECK(test::equals(buffer.data(), "0123456789abcdef"));
    TEST_CHECK(buffer.storage().bytes[15] == 'f');

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    test_write_fits();
    test_write_short();
    test_write_multiple();
    test_write_empty_source();

    test_write_all_fits();
    test_write_all_overflow_keeps_progress();
    test_write_all_empty();

    test_push_all_or_nothing();

    test_heap_storage();
    test_member_view_storage();

    std::cout << "[TEST] ALL BUFFER WRITE TESTS PASSED!\n";
    return 0;
}
