#include <array>
#include <cstdint>
#include <iostream>
#include <span>

#include "embytes/buffer.hpp"
#include "embytes/io/embedded.hpp"

#include "common/bytes.hpp"
#include "common/test_check.hpp"

using namespace embytes;
using namespace embytes::io::embedded;

/*
================================================================================
Embedded I/O Surface - Unit Tests
================================================================================

Adapter<S> must be a transparent view of Buffer<S>: same counts, same cursor
effects, errors mapped onto ErrorKind. The generic helpers are exercised
against the adapter and against a scripted device.
================================================================================
*/

using StackAdapter = Adapter<storage::stack<8>>;

static_assert(Read<StackAdapter>);
static_assert(Write<StackAdapter>);

// Device failing every write after the first `budget` bytes
struct FlakyUart {
    std::size_t budget = 0;
    std::size_t accepted = 0;

    ErrorKind write(std::span<const std::uint8_t> in, std::size_t& n) noexcept {
        if (accepted >= budget) {
            n = 0;
            return ErrorKind::Other;
        }
        n = in.size() < 2 ? in.size() : 2;
        accepted += n;
        return ErrorKind::None;
    }

    ErrorKind flush() noexcept { return ErrorKind::None; }
};

static_assert(Write<FlakyUart>);
static_assert(!Read<FlakyUart>);

// ============================================================================
// Adapter
// ============================================================================

void test_adapter_counts() {
    std::cout << "[TEST] Adapter reports buffer counts unchanged..." << std::endl;

    auto buffer = make_stack_buffer<8>();
    Adapter adapter(buffer);

    std::size_t n = 99;
    TEST_CHECK(adapter.write(as_bytes("0123456789"), n) == ErrorKind::None);
    TEST_CHECK(n == 8);

    TEST_CHECK(adapter.write(as_bytes("x"), n) == ErrorKind::None);
    TEST_CHECK(n == 0);

    std::array<std::uint8_t, 5> out{};
    TEST_CHECK(adapter.read(out, n) == ErrorKind::None);
    TEST_CHECK(n == 5);
    TEST_CHECK(test::equals(std::span<const std::uint8_t>(out), "01234"));

    TEST_CHECK(adapter.read(out, n) == ErrorKind::None);
    TEST_CHECK(n == 3);
    TEST_CHECK(adapter.read(out, n) == ErrorKind::None);
    TEST_CHECK(n == 0);

    TEST_CHECK(&adapter.buffer() == &buffer);

    std::cout << "[TEST] OK\n";
}

void test_adapter_flush_is_noop() {
    std::cout << "[TEST] Adapter::flush() succeeds and changes nothing..." << std::endl;

    auto buffer = make_stack_buffer<8>();
    Adapter adapter(buffer);
    TEST_CHECK(buffer.write("ab") == 2);

    TEST_CHECK(adapter.flush() == ErrorKind::None);
    TEST_CHECK(buffer.read_position() == 0);
    TEST_CHECK(buffer.write_position() == 2);

    std::cout << "[TEST] OK\n";
}

void test_adapter_write_all() {
    std::cout << "[TEST] Adapter::write_all() maps OutOfCapacity to WriteZero..." << std::endl;

    auto buffer = make_stack_buffer<4>();
    Adapter adapter(buffer);

    TEST_CHECK(adapter.write_all(as_bytes("ab")) == ErrorKind::None);
    TEST_CHECK(adapter.write_all(as_bytes("cdef")) == ErrorKind::WriteZero);
    TEST_CHECK(test::equals(buffer.data(), "abcd"));

    std::cout << "[TEST] OK\n";
}

void test_error_kind_mapping() {
    std::cout << "[TEST] Error -> ErrorKind mapping..." << std::endl;

    TEST_CHECK(to_error_kind(Error::None) == ErrorKind::None);
    TEST_CHECK(to_error_kind(Error::OutOfCapacity) == ErrorKind::WriteZero);
    TEST_CHECK(to_error_kind(Error::NoData) == ErrorKind::UnexpectedEof);
    TEST_CHECK(to_error_kind(Error::InvalidJson) == ErrorKind::Other);

    TEST_CHECK(to_string(ErrorKind::WriteZero) == "WriteZero");
    TEST_CHECK(to_string(ErrorKind::UnexpectedEof) == "UnexpectedEof");
    TEST_CHECK(to_string(ErrorKind::OutOfMemory) == "OutOfMemory");
    TEST_CHECK(to_string(ErrorKind::Other) == "Other");
    TEST_CHECK(to_string(ErrorKind::None) == "None");

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// Generic helpers
// ============================================================================

void test_generic_write_all_and_read_exact() {
    std::cout << "[TEST] write_all()/read_exact() over the adapter..." << std::endl;

    auto buffer = make_stack_buffer<8>();
    Adapter adapter(buffer);

    const std::array<std::uint8_t, 6> frame{0xAA, 0x55, 0x01, 0x02, 0x03, 0x04};
    TEST_CHECK(io::embedded::write_all(adapter, frame) == ErrorKind::None);

    std::array<std::uint8_t, 2> header{};
    TEST_CHECK(read_exact(adapter, header) == ErrorKind::None);
    TEST_CHECK(test::bytes_equal(header, {0xAA, 0x55}));

    // Only 4 bytes left: a 6-byte exact read fails after taking them
    std::array<std::uint8_t, 6> body{};
    TEST_CHECK(read_exact(adapter, body) == ErrorKind::UnexpectedEof);
    TEST_CHECK(test::bytes_equal(std::span<const std::uint8_t>(body).first(4), {1, 2, 3, 4}));

    // Full buffer: a write that makes no progress is WriteZero
    TEST_CHECK(io::embedded::write_all(adapter, frame) == ErrorKind::WriteZero);

    std::cout << "[TEST] OK\n";
}

void test_generic_write_all_propagates_device_error() {
    std::cout << "[TEST] write_all() stops on a device error..." << std::endl;

    FlakyUart uart{3};
    const std::array<std::uint8_t, 8> payload{};

    TEST_CHECK(io::embedded::write_all(uart, payload) == ErrorKind::Other);
    // 2 + 2 accepted before the budget ran out
    TEST_CHECK(uart.accepted == 4);

    FlakyUart roomy{16};
    TEST_CHECK(io::embedded::write_all(roomy, payload) == ErrorKind::None);
    TEST_CHECK(roomy.accepted == 8);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    test_adapter_counts();
    test_adapter_flush_is_noop();
    test_adapter_write_all();
    test_error_kind_mapping();

    test_generic_write_all_and_read_exact();
    test_generic_write_all_propagates_device_error();

    std::cout << "[TEST] ALL EMBEDDED I/O TESTS PASSED!\n";
    return 0;
}
