#pragma once

/// Big-endian integer helpers and exact-count reads.
///
/// Every read either fills its buffer completely or throws an IpsError of
/// kind Parsing whose description names the field being read. The short
/// read (std::out_of_range) or I/O failure (std::system_error) behind it is
/// nested as the cause.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "ips/io.h"
#include "ips/types.h"

namespace ips {

/// Low 24 bits of `val`, most significant byte first. Higher bits are dropped.
std::array<uint8_t, IPS_U24_SIZE> encode_u24_be(uint32_t val);
uint32_t decode_u24_be(const uint8_t* p);

std::array<uint8_t, IPS_U16_SIZE> encode_u16_be(uint16_t val);
uint16_t decode_u16_be(const uint8_t* p);

/// Read until `buf` is full or the source is exhausted.
/// Returns the number of bytes read.
size_t read_fully(ByteSource& src, std::span<uint8_t> buf);

/// Fill `buf` or throw IpsError(Parsing, description).
void read_exact(ByteSource& src, std::span<uint8_t> buf, const char* description);

uint32_t read_u24_be(ByteSource& src, const char* description);
uint16_t read_u16_be(ByteSource& src, const char* description);
uint8_t read_u8(ByteSource& src, const char* description);

/// Read expected.size() bytes and compare them to `expected`.
/// A short read fails with `read_description`, a mismatch with
/// `mismatch_description`.
void read_signature(
    ByteSource& src,
    std::span<const uint8_t> expected,
    const char* read_description,
    const char* mismatch_description);

} // namespace ips
