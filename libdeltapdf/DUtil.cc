#include <deltapdf/DUtil.hh>

#include <deltapdf/DIntC.hh>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <locale>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace
{
    using file_ptr = std::unique_ptr<FILE, decltype(&fclose)>;

    [[noreturn]] void
    system_error(std::string const& what)
    {
        throw std::runtime_error(what + ": " + strerror(errno));
    }

    file_ptr
    open_file(std::string const& filename, char const* mode)
    {
        file_ptr f(fopen(filename.c_str(), mode), &fclose);
        if (!f) {
            system_error("open " + filename);
        }
        return f;
    }
} // namespace

std::string
DUtil::int_to_string(long long num, int length)
{
    return int_to_string_base(num, 10, length);
}

std::string
DUtil::int_to_string_base(long long num, int base, int length)
{
    if (base != 8 && base != 10 && base != 16) {
        throw std::logic_error("int_to_string_base called with unsupported base");
    }
    char buf[72];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), num, base);
    if (ec != std::errc()) {
        throw std::logic_error("int_to_string_base: conversion failed");
    }
    std::string digits(buf, end);
    auto width = DIntC::to_size(length < 0 ? -length : length);
    if (digits.size() >= width) {
        return digits;
    }
    if (length > 0) {
        return std::string(width - digits.size(), '0') + digits;
    }
    return digits + std::string(width - digits.size(), ' ');
}

std::string
DUtil::double_to_string(double num, int decimal_places, bool trim_trailing_zeroes)
{
    std::ostringstream buf;
    buf.imbue(std::locale::classic());
    buf << std::fixed << std::setprecision(decimal_places > 0 ? decimal_places : 6) << num;
    std::string result = buf.str();
    if (trim_trailing_zeroes && result.find('.') != std::string::npos) {
        result.erase(result.find_last_not_of('0') + 1);
        if (result.back() == '.') {
            result.pop_back();
        }
    }
    if (result == "-0") {
        result = "0";
    }
    return result;
}

long long
DUtil::string_to_ll(char const* str)
{
    errno = 0;
    long long result = strtoll(str, nullptr, 10);
    if (errno == ERANGE) {
        throw std::range_error(
            std::string("overflow/underflow converting ") + str + " to 64-bit integer");
    }
    return result;
}

int
DUtil::string_to_int(char const* str)
{
    return DIntC::to_int(string_to_ll(str));
}

std::string
DUtil::read_file_into_string(char const* filename)
{
    auto f = open_file(filename, "rb");
    std::string result;
    char buf[8192];
    size_t len = 0;
    while ((len = fread(buf, 1, sizeof(buf), f.get())) > 0) {
        result.append(buf, len);
    }
    if (ferror(f.get())) {
        system_error(std::string("read ") + filename);
    }
    return result;
}

void
DUtil::write_string_to_file(char const* filename, std::string const& data)
{
    std::string tmpname = std::string(filename) + ".~dpdf";
    {
        auto f = open_file(tmpname, "wb");
        if (fwrite(data.data(), 1, data.size(), f.get()) != data.size() || fflush(f.get()) != 0) {
            system_error("write " + tmpname);
        }
    }
    if (rename(tmpname.c_str(), filename) != 0) {
        system_error("rename " + tmpname + " to " + filename);
    }
}

std::string
DUtil::hex_encode(std::string_view input)
{
    static char const digits[] = "0123456789abcdef";
    std::string result(2 * input.size(), '\0');
    size_t pos = 0;
    for (unsigned char c: input) {
        result[pos++] = digits[c >> 4];
        result[pos++] = digits[c & 0xf];
    }
    return result;
}
