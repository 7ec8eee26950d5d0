#include "ips/codec.h"

#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace ips {

std::array<uint8_t, IPS_U24_SIZE> encode_u24_be(uint32_t val) {
    return {
        static_cast<uint8_t>((val >> 16) & 0xFF),
        static_cast<uint8_t>((val >> 8) & 0xFF),
        static_cast<uint8_t>(val & 0xFF),
    };
}

uint32_t decode_u24_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 16)
         | (static_cast<uint32_t>(p[1]) << 8)
         | static_cast<uint32_t>(p[2]);
}

std::array<uint8_t, IPS_U16_SIZE> encode_u16_be(uint16_t val) {
    return {
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val & 0xFF),
    };
}

uint16_t decode_u16_be(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

size_t read_fully(ByteSource& src, std::span<uint8_t> buf) {
    size_t got = 0;
    while (got < buf.size()) {
        size_t n = src.read(buf.subspan(got));
        if (n == 0) break;
        got += n;
    }
    return got;
}

void read_exact(ByteSource& src, std::span<uint8_t> buf, const char* description) {
    try {
        size_t got = read_fully(src, buf);
        if (got != buf.size()) {
            throw std::out_of_range("unexpected end of input: wanted "
                + std::to_string(buf.size()) + " bytes, got "
                + std::to_string(got));
        }
    } catch (const std::exception&) {
        std::throw_with_nested(IpsError(ErrorKind::Parsing, description));
    }
}

uint32_t read_u24_be(ByteSource& src, const char* description) {
    uint8_t buf[IPS_U24_SIZE];
    read_exact(src, buf, description);
    return decode_u24_be(buf);
}

uint16_t read_u16_be(ByteSource& src, const char* description) {
    uint8_t buf[IPS_U16_SIZE];
    read_exact(src, buf, description);
    return decode_u16_be(buf);
}

uint8_t read_u8(ByteSource& src, const char* description) {
    uint8_t b;
    read_exact(src, {&b, 1}, description);
    return b;
}

void read_signature(
    ByteSource& src,
    std::span<const uint8_t> expected,
    const char* read_description,
    const char* mismatch_description) {

    std::vector<uint8_t> buf(expected.size());
    read_exact(src, buf, read_description);
    if (std::memcmp(buf.data(), expected.data(), expected.size()) != 0) {
        throw IpsError(ErrorKind::Parsing, mismatch_description);
    }
}

} // namespace ips
