#include <deltapdf/assert_test.h>

#include <deltapdf/DIntC.hh>
#include <deltapdf/DUtil.hh>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <stdexcept>

template <typename F>
static bool
throws_range_error(F f)
{
    try {
        f();
    } catch (std::range_error& e) {
        std::cout << "range error: " << e.what() << '\n';
        return true;
    }
    return false;
}

static void
test_numbers()
{
    assert(DUtil::int_to_string(42) == "42");
    assert(DUtil::int_to_string(42, 10) == "0000000042");
    assert(DUtil::int_to_string(-3, -4) == "-3  ");
    assert(DUtil::int_to_string(65535, 5) == "65535");
    assert(DUtil::int_to_string_base(255, 16) == "ff");
    assert(DUtil::int_to_string_base(8, 8, 3) == "010");
    assert(DUtil::double_to_string(1.5) == "1.5");
    assert(DUtil::double_to_string(2.0) == "2");
    assert(DUtil::double_to_string(0.126, 2) == "0.13");
    assert(DUtil::double_to_string(1.5, 3, false) == "1.500");
    assert(DUtil::double_to_string(-0.0001, 2) == "0");

    assert(DUtil::string_to_ll("  -1234") == -1234);
    assert(DUtil::string_to_ll("0000000123") == 123);
    assert(DUtil::string_to_int("2147483647") == 2147483647);
    assert(throws_range_error([]() { DUtil::string_to_ll("99999999999999999999"); }));
    assert(throws_range_error([]() { DUtil::string_to_int("2147483648"); }));
    assert(DUtil::double_to_string(100.0, 2) == "100");
}

static void
test_hex()
{
    assert(DUtil::hex_encode(std::string("\x00\xff" "A", 3)) == "00ff41");
    assert(DUtil::hex_encode("").empty());
    assert(DUtil::hex_encode("\x7f\x80") == "7f80");
}

static void
test_files()
{
    std::string data("binary\0data\r\n", 13);
    DUtil::write_string_to_file("dutil-test.out", data);
    assert(DUtil::read_file_into_string("dutil-test.out") == data);
    DUtil::write_string_to_file("dutil-test.out", "replaced");
    assert(DUtil::read_file_into_string("dutil-test.out") == "replaced");
    std::remove("dutil-test.out");

    try {
        DUtil::read_file_into_string("dutil-test.missing");
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "read error: " << e.what() << '\n';
    }
}

static void
test_intc()
{
    uint32_t u1 = 3141592653U;
    int32_t i1 = -1153374643;
    uint64_t ul1 = 1099511627776LL;
    long long offset = 12345;

    assert(DIntC::to_int(offset) == 12345);
    assert(DIntC::to_size(offset) == 12345U);
    assert(DIntC::to_offset(u1) == 3141592653LL);
    assert(DIntC::to_uint(u1) == u1);
    assert(DIntC::to_longlong(i1) == -1153374643LL);
    assert(throws_range_error([&]() { DIntC::to_int(u1); }));
    assert(throws_range_error([&]() { DIntC::to_uint(i1); }));
    assert(throws_range_error([&]() { DIntC::to_size(i1); }));
    assert(throws_range_error([&]() { DIntC::to_int(ul1); }));

    int big = std::numeric_limits<int>::max() - 5;
    DIntC::range_check(big, 5);
    assert(throws_range_error([&]() { DIntC::range_check(big, 6); }));
    int small = std::numeric_limits<int>::min() + 5;
    DIntC::range_check(small, -5);
    assert(throws_range_error([&]() { DIntC::range_check(small, -6); }));
    // Opposite signs can't overflow
    DIntC::range_check(big, -1000);
}

int
main()
{
    test_numbers();
    test_hex();
    test_files();
    test_intc();
    std::cout << "dutil tests done" << '\n';
    return 0;
}
