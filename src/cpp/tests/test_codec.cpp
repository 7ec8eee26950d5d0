#include <catch2/catch_test_macros.hpp>
#include <ips/codec.h>
#include <ips/hunk.h>
#include <ips/io.h>

#include <cstdint>
#include <exception>
#include <numeric>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace ips;

// ── helpers ──────────────────────────────────────────────────────────────

/// Source whose every read fails.
class BrokenSource : public ByteSource {
public:
    size_t read(std::span<uint8_t>) override {
        throw std::system_error(std::make_error_code(std::errc::io_error), "read");
    }
};

/// Source that hands out at most one byte per read.
class TrickleSource : public ByteSource {
public:
    explicit TrickleSource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    size_t read(std::span<uint8_t> buf) override {
        if (buf.empty() || pos_ >= data_.size()) return 0;
        buf[0] = data_[pos_++];
        return 1;
    }
private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

/// Target whose seek fails.
class UnseekableTarget : public Target {
public:
    void seek(uint64_t) override {
        throw std::system_error(std::make_error_code(std::errc::invalid_seek), "seek");
    }
    void write(std::span<const uint8_t>) override {}
    void truncate(uint64_t) override {}
};

/// Target whose write fails.
class FullTarget : public Target {
public:
    void seek(uint64_t) override {}
    void write(std::span<const uint8_t>) override {
        throw std::system_error(std::make_error_code(std::errc::no_space_on_device), "write");
    }
    void truncate(uint64_t) override {}
};

static std::vector<uint8_t> iota16() {
    std::vector<uint8_t> v(16);
    std::iota(v.begin(), v.end(), 0);
    return v;
}

// ── big-endian integers ──────────────────────────────────────────────────

TEST_CASE("u24 encodes most significant byte first", "[codec]") {
    auto b = encode_u24_be(0x010203);
    CHECK(b[0] == 0x01);
    CHECK(b[1] == 0x02);
    CHECK(b[2] == 0x03);
    CHECK(decode_u24_be(b.data()) == 0x010203);
}

TEST_CASE("u24 encode drops bits above 24", "[codec]") {
    auto b = encode_u24_be(0xAB123456);
    CHECK(decode_u24_be(b.data()) == 0x123456);
}

TEST_CASE("u24 covers the full offset range", "[codec]") {
    CHECK(decode_u24_be(encode_u24_be(0).data()) == 0);
    CHECK(decode_u24_be(encode_u24_be(IPS_MAX_OFFSET).data()) == IPS_MAX_OFFSET);
    CHECK(decode_u24_be(IPS_EOF) == IPS_EOF_OFFSET);
}

TEST_CASE("u16 big-endian", "[codec]") {
    auto b = encode_u16_be(0xAABB);
    CHECK(b[0] == 0xAA);
    CHECK(b[1] == 0xBB);
    CHECK(decode_u16_be(b.data()) == 0xAABB);
}

// ── exact reads ──────────────────────────────────────────────────────────

TEST_CASE("read_exact consumes exactly the requested bytes", "[codec]") {
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    SpanSource src(data);
    CHECK(read_u24_be(src, "offset") == 0x010203);
    CHECK(src.position() == 3);
    CHECK(read_u8(src, "byte") == 4);
    CHECK(src.remaining() == 1);
}

TEST_CASE("read_exact gathers partial reads", "[codec]") {
    TrickleSource src({0x12, 0x34, 0x56, 0x78, 0x9A});
    CHECK(read_u24_be(src, "offset") == 0x123456);
    CHECK(read_u16_be(src, "length") == 0x789A);
}

TEST_CASE("short read is a parsing error with the field description", "[codec]") {
    std::vector<uint8_t> data = {0x01};
    SpanSource src(data);
    bool caught_cause = false;
    try {
        read_u24_be(src, "Unable to parse offset.");
        FAIL("expected IpsError");
    } catch (const IpsError& e) {
        CHECK(e.kind() == ErrorKind::Parsing);
        CHECK(e.description() == "Unable to parse offset.");
        CHECK(std::string(e.what()) == "ParsingError: Unable to parse offset.");
        try {
            std::rethrow_if_nested(e);
        } catch (const std::out_of_range&) {
            caught_cause = true;
        }
    }
    CHECK(caught_cause);
}

TEST_CASE("source I/O failure is nested under the parsing error", "[codec]") {
    BrokenSource src;
    bool caught_cause = false;
    try {
        read_u16_be(src, "Unable to read length.");
        FAIL("expected IpsError");
    } catch (const IpsError& e) {
        CHECK(e.description() == "Unable to read length.");
        try {
            std::rethrow_if_nested(e);
        } catch (const std::system_error& cause) {
            caught_cause = cause.code() == std::errc::io_error;
        }
    }
    CHECK(caught_cause);
}

TEST_CASE("signature short read and mismatch are distinct", "[codec]") {
    std::vector<uint8_t> short_data = {'P', 'A'};
    SpanSource s1(short_data);
    try {
        read_signature(s1, IPS_HEADER, "short", "mismatch");
        FAIL("expected IpsError");
    } catch (const IpsError& e) {
        CHECK(e.description() == "short");
    }

    std::vector<uint8_t> wrong = {'P', 'A', 'T', 'T', 'H'};
    SpanSource s2(wrong);
    try {
        read_signature(s2, IPS_HEADER, "short", "mismatch");
        FAIL("expected IpsError");
    } catch (const IpsError& e) {
        CHECK(e.description() == "mismatch");
    }
}

// ── hunk decode ──────────────────────────────────────────────────────────

TEST_CASE("nonzero length field decodes a regular hunk", "[hunk]") {
    std::vector<uint8_t> body = {0xAA, 0xBB, 0xFF};
    SpanSource src(body);
    auto hunk = decode_hunk(src, 258, 2);
    REQUIRE(hunk == Hunk{RegularHunk{258, 2, {0xAA, 0xBB}}});
    CHECK(src.remaining() == 1);
}

TEST_CASE("zero length field decodes an RLE hunk", "[hunk]") {
    std::vector<uint8_t> body = {0xAA, 0xBB, 0xCC};
    SpanSource src(body);
    auto hunk = decode_hunk(src, 258, 0);
    REQUIRE(hunk == Hunk{RleHunk{258, 0xAABB, 0xCC}});
    CHECK(src.remaining() == 0);
}

TEST_CASE("truncated hunk bodies name the missing field", "[hunk]") {
    auto description_of = [](std::vector<uint8_t> body, uint16_t field) {
        SpanSource src(body);
        try {
            decode_hunk(src, 0, field);
        } catch (const IpsError& e) {
            return e.description();
        }
        return std::string("no error");
    };
    CHECK(description_of({0xAA}, 2) == "Unable to read payload.");
    CHECK(description_of({0x00}, 0) == "Unable to read RLE run length.");
    CHECK(description_of({0x00, 0x03}, 0) == "Unable to read RLE payload.");
}

// ── hunk encode ──────────────────────────────────────────────────────────

TEST_CASE("regular hunk wire form", "[hunk]") {
    std::vector<uint8_t> out;
    encode_hunk(RegularHunk{258, 2, {0xAA, 0xBB}}, out);
    REQUIRE(out == std::vector<uint8_t>{0x00, 0x01, 0x02, 0x00, 0x02, 0xAA, 0xBB});
}

TEST_CASE("RLE hunk wire form", "[hunk]") {
    std::vector<uint8_t> out;
    encode_hunk(RleHunk{258, 43707, 0xCC}, out);
    REQUIRE(out == std::vector<uint8_t>{0x00, 0x01, 0x02, 0x00, 0x00, 0xAA, 0xBB, 0xCC});
}

// ── hunk apply ───────────────────────────────────────────────────────────

TEST_CASE("regular hunk overwrites payload at offset", "[hunk]") {
    auto buf = iota16();
    BufferTarget target(buf);
    apply_hunk(RegularHunk{1, 3, {0x0a, 0x0b, 0x0c}}, target);
    REQUIRE(buf == std::vector<uint8_t>{0, 0x0a, 0x0b, 0x0c, 4, 5, 6, 7,
                                        8, 9, 10, 11, 12, 13, 14, 15});
}

TEST_CASE("RLE hunk repeats its byte", "[hunk]") {
    auto buf = iota16();
    BufferTarget target(buf);
    apply_hunk(RleHunk{1, 3, 0x0a}, target);
    REQUIRE(buf == std::vector<uint8_t>{0, 0x0a, 0x0a, 0x0a, 4, 5, 6, 7,
                                        8, 9, 10, 11, 12, 13, 14, 15});
}

TEST_CASE("zero-length RLE run writes nothing", "[hunk]") {
    auto buf = iota16();
    BufferTarget target(buf);
    apply_hunk(RleHunk{4, 0, 0xFF}, target);
    REQUIRE(buf == iota16());
}

TEST_CASE("hunk past the end extends the buffer target", "[hunk]") {
    std::vector<uint8_t> buf = {1, 2};
    BufferTarget target(buf);
    apply_hunk(RegularHunk{4, 2, {7, 8}}, target);
    REQUIRE(buf == std::vector<uint8_t>{1, 2, 0, 0, 7, 8});
}

TEST_CASE("target failures are patching errors", "[hunk]") {
    UnseekableTarget unseekable;
    FullTarget full;

    try {
        apply_hunk(RegularHunk{0, 1, {1}}, unseekable);
        FAIL("expected IpsError");
    } catch (const IpsError& e) {
        CHECK(e.kind() == ErrorKind::Patching);
        CHECK(e.description() == "Unable to apply ips regular hunk.");
    }

    bool caught_cause = false;
    try {
        apply_hunk(RleHunk{0, 4, 1}, full);
        FAIL("expected IpsError");
    } catch (const IpsError& e) {
        CHECK(e.kind() == ErrorKind::Patching);
        CHECK(e.description() == "Unable to apply ips RLE hunk.");
        try {
            std::rethrow_if_nested(e);
        } catch (const std::system_error& cause) {
            caught_cause = cause.code() == std::errc::no_space_on_device;
        }
    }
    CHECK(caught_cause);
}

TEST_CASE("hunk extent helpers", "[hunk]") {
    Hunk regular = RegularHunk{0x10, 3, {1, 2, 3}};
    Hunk rle = RleHunk{0xFFFFFF, 0xFFFF, 0};
    CHECK(hunk_offset(regular) == 0x10);
    CHECK(hunk_size(regular) == 3);
    CHECK(hunk_end(regular) == 0x13);
    CHECK(hunk_size(rle) == 0xFFFF);
    CHECK(hunk_end(rle) == 0xFFFFFFull + 0xFFFF);
}
