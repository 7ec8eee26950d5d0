#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ips {

// ============================================================================
// Constants
//
// Layout:   "PATCH" hunk* "EOF" [truncate:u24]
// Hunk:     offset:u24 length:u16 payload[length]          (length != 0)
//           offset:u24 0x0000 run_length:u16 value:u8      (RLE)
// All integers are big-endian.
// ============================================================================

inline constexpr uint8_t IPS_HEADER[5] = {'P', 'A', 'T', 'C', 'H'};
inline constexpr size_t  IPS_HEADER_SIZE = sizeof(IPS_HEADER);
inline constexpr uint8_t IPS_EOF[3] = {'E', 'O', 'F'};
inline constexpr size_t  IPS_EOF_SIZE = sizeof(IPS_EOF);
inline constexpr uint32_t IPS_EOF_OFFSET = 0x454F46; // "EOF" read as an offset
inline constexpr size_t  IPS_U24_SIZE = 3;
inline constexpr size_t  IPS_U16_SIZE = 2;
inline constexpr uint32_t IPS_MAX_OFFSET = 0xFFFFFF;
inline constexpr uint16_t IPS_RLE_MARKER = 0;

// ============================================================================
// Hunks
// ============================================================================

/// Literal hunk: `payload` is written verbatim at `offset`.
/// `length` is the on-wire length field and is never 0 for a parsed hunk.
/// Callers building hunks must keep `length == payload.size()`; encode does not check.
struct RegularHunk {
    uint32_t offset;
    uint16_t length;
    std::vector<uint8_t> payload;
    bool operator==(const RegularHunk&) const = default;
};

/// Run-length hunk: `payload` is written `run_length` times at `offset`.
struct RleHunk {
    uint32_t offset;
    uint16_t run_length;
    uint8_t payload;
    bool operator==(const RleHunk&) const = default;
};

/// One edit record of a patch.
using Hunk = std::variant<RegularHunk, RleHunk>;

// ============================================================================
// Patch
// ============================================================================

/// An ordered list of hunks plus an optional truncate length.
/// Hunks are applied in order; a later hunk may overwrite an earlier one.
struct Patch {
    std::vector<Hunk> hunks;
    std::optional<uint32_t> truncate;

    void add_hunk(Hunk hunk) { hunks.push_back(std::move(hunk)); }

    Patch& with_hunk(Hunk hunk) {
        add_hunk(std::move(hunk));
        return *this;
    }

    Patch& with_truncate(uint32_t length) {
        truncate = length;
        return *this;
    }

    bool operator==(const Patch&) const = default;
};

// ============================================================================
// Error type
// ============================================================================

enum class ErrorKind { Parsing, Patching };

/// "ParsingError" or "PatchingError".
const char* error_kind_name(ErrorKind kind) noexcept;

/// Raised for malformed patch bytes (Parsing) and for target I/O failures
/// (Patching). The underlying failure, if any, is attached with
/// std::throw_with_nested.
class IpsError : public std::runtime_error {
public:
    IpsError(ErrorKind kind, std::string description);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& description() const noexcept { return description_; }

private:
    ErrorKind kind_;
    std::string description_;
};

// ============================================================================
// Apply options
// ============================================================================

struct ApplyOptions {
    bool verbose = false;   // trace each hunk on stderr
};

// ============================================================================
// Summary statistics
// ============================================================================

struct PatchSummary {
    size_t num_hunks;
    size_t num_regular;
    size_t num_rle;
    size_t regular_bytes;     // literal payload bytes
    size_t rle_bytes;         // bytes produced by RLE runs
    size_t total_write_bytes;
    uint64_t max_end;         // highest offset + size written
    std::optional<uint32_t> truncate;
};

PatchSummary patch_summary(const Patch& patch);

} // namespace ips
