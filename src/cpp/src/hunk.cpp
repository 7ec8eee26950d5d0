#include "ips/hunk.h"

#include <exception>

#include "ips/codec.h"

namespace ips {

Hunk decode_hunk(ByteSource& src, uint32_t offset, uint16_t field) {
    if (field == IPS_RLE_MARKER) {
        uint16_t run_length = read_u16_be(src, "Unable to read RLE run length.");
        uint8_t value = read_u8(src, "Unable to read RLE payload.");
        return RleHunk{offset, run_length, value};
    }
    std::vector<uint8_t> payload(field);
    read_exact(src, payload, "Unable to read payload.");
    return RegularHunk{offset, field, std::move(payload)};
}

void encode_hunk(const Hunk& hunk, std::vector<uint8_t>& out) {
    if (auto* h = std::get_if<RegularHunk>(&hunk)) {
        auto off = encode_u24_be(h->offset);
        auto len = encode_u16_be(h->length);
        out.insert(out.end(), off.begin(), off.end());
        out.insert(out.end(), len.begin(), len.end());
        out.insert(out.end(), h->payload.begin(), h->payload.end());
    } else if (auto* r = std::get_if<RleHunk>(&hunk)) {
        auto off = encode_u24_be(r->offset);
        auto marker = encode_u16_be(IPS_RLE_MARKER);
        auto run = encode_u16_be(r->run_length);
        out.insert(out.end(), off.begin(), off.end());
        out.insert(out.end(), marker.begin(), marker.end());
        out.insert(out.end(), run.begin(), run.end());
        out.push_back(r->payload);
    }
}

void apply_hunk(const Hunk& hunk, Target& target) {
    if (auto* h = std::get_if<RegularHunk>(&hunk)) {
        try {
            target.seek(h->offset);
            target.write(h->payload);
        } catch (const std::exception&) {
            std::throw_with_nested(
                IpsError(ErrorKind::Patching, "Unable to apply ips regular hunk."));
        }
    } else if (auto* r = std::get_if<RleHunk>(&hunk)) {
        try {
            target.seek(r->offset);
            std::vector<uint8_t> run(r->run_length, r->payload);
            target.write(run);
        } catch (const std::exception&) {
            std::throw_with_nested(
                IpsError(ErrorKind::Patching, "Unable to apply ips RLE hunk."));
        }
    }
}

uint32_t hunk_offset(const Hunk& hunk) {
    return std::visit([](const auto& h) { return h.offset; }, hunk);
}

size_t hunk_size(const Hunk& hunk) {
    if (auto* h = std::get_if<RegularHunk>(&hunk)) return h->payload.size();
    return std::get<RleHunk>(hunk).run_length;
}

uint64_t hunk_end(const Hunk& hunk) {
    return static_cast<uint64_t>(hunk_offset(hunk)) + hunk_size(hunk);
}

} // namespace ips
