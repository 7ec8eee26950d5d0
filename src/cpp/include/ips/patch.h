#pragma once

/// Whole-patch parse, serialize and apply.

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "ips/io.h"
#include "ips/types.h"

namespace ips {

/// Parse a complete patch. Throws IpsError(Parsing) on malformed input.
/// Reading stops after the EOF marker and the optional truncate field.
Patch read_patch(ByteSource& src);
Patch read_patch(std::span<const uint8_t> data);

/// Append the wire form of `patch` to `out`.
void write_patch(const Patch& patch, std::vector<uint8_t>& out);
std::vector<uint8_t> encode_patch(const Patch& patch);

/// Apply each hunk in order, then clamp the target to `patch.truncate`
/// if present. Throws IpsError(Patching); hunks applied before a failure
/// stay applied.
void apply_patch(const Patch& patch, Target& target, const ApplyOptions& opts = {});

/// Parse `src` and apply each hunk to `target` as soon as it is decoded,
/// without keeping the hunks. Produces the same target as
/// apply_patch(read_patch(src), target).
void apply_ips_patch(ByteSource& src, Target& target, const ApplyOptions& opts = {});

} // namespace ips
