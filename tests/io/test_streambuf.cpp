#include <cstdint>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>

#include "embytes/buffer.hpp"
#include "embytes/io/streambuf.hpp"

#include "common/bytes.hpp"
#include "common/test_check.hpp"

using namespace embytes;

/*
================================================================================
std::streambuf Bridge - Unit Tests
================================================================================

std::ostream formatting lands in the buffer's free region, std::istream
extraction drains the readable region. A full buffer surfaces as badbit on
the output side, a drained buffer as eof on the input side.
================================================================================
*/

void test_ostream_formatting() {
    std::cout << "[TEST] std::ostream writes into the buffer..." << std::endl;

    auto buffer = make_stack_buffer<64>();
    io::host::streambuf sb(buffer);
    std::ostream os(&sb);

    os << "answer=" << 42 << ';' << "pi=" << 3.5;
    TEST_CHECK(os.good());
    TEST_CHECK(test::equals(buffer.data(), "answer=42;pi=3.5"));

    std::cout << "[TEST] OK\n";
}

void test_ostream_short_write_sets_badbit() {
    std::cout << "[TEST] std::ostream on a full buffer sets badbit..." << std::endl;

    auto buffer = make_stack_buffer<4>();
    io::host::streambuf sb(buffer);
    std::ostream os(&sb);

    os << "abcdef";
    TEST_CHECK(os.bad());
    // What fit is still in the buffer
    TEST_CHECK(test::equals(buffer.data(), "abcd"));

    os.clear();
    os.put('x');
    TEST_CHECK(os.bad());

    std::cout << "[TEST] OK\n";
}

void test_istream_extraction() {
    std::cout << "[TEST] std::istream reads from the buffer..." << std::endl;

    auto buffer = make_stack_buffer<64>();
    TEST_CHECK(buffer.write_all("17 words here\nsecond line\n") == Error::None);

    io::host::streambuf sb(buffer);
    std::istream is(&sb);

    int number = 0;
    std::string word;
    is >> number >> word;
    TEST_CHECK(number == 17);
    TEST_CHECK(word == "words");

    std::string rest;
    std::getline(is, rest);
    TEST_CHECK(rest == " here");
    std::getline(is, rest);
    TEST_CHECK(rest == "second line");

    TEST_CHECK(!buffer.has_remaining_len());

    // Drained buffer: eof
    std::getline(is, rest);
    TEST_CHECK(is.eof());

    std::cout << "[TEST] OK\n";
}

void test_istream_read_partial() {
    std::cout << "[TEST] std::istream::read() reports a short gcount..." << std::endl;

    auto buffer = make_stack_buffer<16>();
    TEST_CHECK(buffer.write("abc") == 3);

    io::host::streambuf sb(buffer);
    std::istream is(&sb);

    char out[8] = {};
    is.read(out, sizeof(out));
    TEST_CHECK(is.gcount() == 3);
    TEST_CHECK(is.eof());
    TEST_CHECK(std::string(out, 3) == "abc");

    std::cout << "[TEST] OK\n";
}

void test_peek_does_not_consume() {
    std::cout << "[TEST] std::istream::peek() leaves the byte pending..." << std::endl;

    auto buffer = make_stack_buffer<8>();
    TEST_CHECK(buffer.write("xy") == 2);

    io::host::streambuf sb(buffer);
    std::istream is(&sb);

    TEST_CHECK(is.peek() == 'x');
    TEST_CHECK(buffer.remaining_len() == 2);
    TEST_CHECK(is.get() == 'x');
    TEST_CHECK(buffer.remaining_len() == 1);
    TEST_CHECK(sb.in_avail() == 1);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    test_ostream_formatting();
    test_ostream_short_write_sets_badbit();
    test_istream_extraction();
    test_istream_read_partial();
    test_peek_does_not_consume();

    std::cout << "[TEST] ALL STREAMBUF TESTS PASSED!\n";
    return 0;
}
