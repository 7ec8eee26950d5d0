#pragma once

/// Per-hunk decode, encode and apply.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ips/io.h"
#include "ips/types.h"

namespace ips {

/// Decode the body of a hunk whose offset and 16-bit length field have
/// already been read. A zero `field` selects the RLE form.
Hunk decode_hunk(ByteSource& src, uint32_t offset, uint16_t field);

/// Append the wire form of `hunk` to `out`.
void encode_hunk(const Hunk& hunk, std::vector<uint8_t>& out);

/// Seek to the hunk's offset and write its bytes. Throws IpsError(Patching)
/// if the target fails; nothing else about the target is changed.
void apply_hunk(const Hunk& hunk, Target& target);

uint32_t hunk_offset(const Hunk& hunk);

/// Number of bytes the hunk writes when applied.
size_t hunk_size(const Hunk& hunk);

/// One past the last byte the hunk writes.
uint64_t hunk_end(const Hunk& hunk);

} // namespace ips
