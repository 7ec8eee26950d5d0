#include "ips/patch.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "ips/codec.h"
#include "ips/hunk.h"

namespace ips {

namespace {

/// Optional truncate field after the EOF marker: three bytes, or nothing.
std::optional<uint32_t> read_truncate(ByteSource& src) {
    uint8_t buf[IPS_U24_SIZE];
    try {
        size_t got = read_fully(src, buf);
        if (got == 0) return std::nullopt;
        if (got != IPS_U24_SIZE) {
            throw std::out_of_range("truncate field has "
                + std::to_string(got) + " of 3 bytes");
        }
    } catch (const std::exception&) {
        std::throw_with_nested(IpsError(ErrorKind::Parsing, "Unable to read truncate."));
    }
    return decode_u24_be(buf);
}

/// Header check followed by the hunk loop. Each decoded hunk is handed to
/// `on_hunk`; the return value is the truncate length, if the patch has one.
template <typename OnHunk>
std::optional<uint32_t> read_hunks(ByteSource& src, OnHunk&& on_hunk) {
    read_signature(src, IPS_HEADER, "Unable to parse header.", "Invalid header.");
    for (;;) {
        uint32_t offset = read_u24_be(src, "Unable to parse offset.");
        if (offset == IPS_EOF_OFFSET) {
            return read_truncate(src);
        }
        uint16_t field = read_u16_be(src, "Unable to read length.");
        on_hunk(decode_hunk(src, offset, field));
    }
}

void trace_hunk(size_t idx, const Hunk& hunk) {
    if (auto* h = std::get_if<RegularHunk>(&hunk)) {
        std::fprintf(stderr, "hunk %zu: regular offset=0x%06x length=%u\n",
            idx, static_cast<unsigned>(h->offset),
            static_cast<unsigned>(h->length));
    } else if (auto* r = std::get_if<RleHunk>(&hunk)) {
        std::fprintf(stderr, "hunk %zu: rle     offset=0x%06x run=%u value=0x%02x\n",
            idx, static_cast<unsigned>(r->offset),
            static_cast<unsigned>(r->run_length),
            static_cast<unsigned>(r->payload));
    }
}

void truncate_target(Target& target, uint32_t length, bool verbose) {
    if (verbose) {
        std::fprintf(stderr, "truncate: at most %u bytes\n",
            static_cast<unsigned>(length));
    }
    try {
        target.truncate(length);
    } catch (const std::exception&) {
        std::throw_with_nested(IpsError(ErrorKind::Patching, "Unable to truncate target."));
    }
}

} // anonymous namespace

PatchSummary patch_summary(const Patch& patch) {
    size_t num_regular = 0, num_rle = 0, regular_bytes = 0, rle_bytes = 0;
    uint64_t max_end = 0;
    for (const auto& hunk : patch.hunks) {
        if (auto* h = std::get_if<RegularHunk>(&hunk)) {
            ++num_regular;
            regular_bytes += h->payload.size();
        } else if (auto* r = std::get_if<RleHunk>(&hunk)) {
            ++num_rle;
            rle_bytes += r->run_length;
        }
        max_end = std::max(max_end, hunk_end(hunk));
    }
    return {patch.hunks.size(), num_regular, num_rle, regular_bytes, rle_bytes,
            regular_bytes + rle_bytes, max_end, patch.truncate};
}

Patch read_patch(ByteSource& src) {
    Patch patch;
    patch.truncate = read_hunks(src, [&](Hunk&& hunk) {
        patch.add_hunk(std::move(hunk));
    });
    return patch;
}

Patch read_patch(std::span<const uint8_t> data) {
    SpanSource src(data);
    return read_patch(src);
}

void write_patch(const Patch& patch, std::vector<uint8_t>& out) {
    out.insert(out.end(), IPS_HEADER, IPS_HEADER + IPS_HEADER_SIZE);
    for (const auto& hunk : patch.hunks) {
        encode_hunk(hunk, out);
    }
    out.insert(out.end(), IPS_EOF, IPS_EOF + IPS_EOF_SIZE);
    if (patch.truncate) {
        auto trunc = encode_u24_be(*patch.truncate);
        out.insert(out.end(), trunc.begin(), trunc.end());
    }
}

std::vector<uint8_t> encode_patch(const Patch& patch) {
    std::vector<uint8_t> out;
    write_patch(patch, out);
    return out;
}

void apply_patch(const Patch& patch, Target& target, const ApplyOptions& opts) {
    size_t idx = 0;
    for (const auto& hunk : patch.hunks) {
        if (opts.verbose) trace_hunk(idx, hunk);
        apply_hunk(hunk, target);
        ++idx;
    }
    if (patch.truncate) {
        truncate_target(target, *patch.truncate, opts.verbose);
    }
}

void apply_ips_patch(ByteSource& src, Target& target, const ApplyOptions& opts) {
    size_t idx = 0;
    auto truncate = read_hunks(src, [&](Hunk&& hunk) {
        if (opts.verbose) trace_hunk(idx, hunk);
        apply_hunk(hunk, target);
        ++idx;
    });
    if (truncate) {
        truncate_target(target, *truncate, opts.verbose);
    }
}

} // namespace ips
