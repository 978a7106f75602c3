#pragma once

#include "geometrytools/digest.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace geometrytools::armor {

// --- Layout ---
//
// # 0x0000
// fill:20                      0xFF
// numberOfArmorModelBlocks:4   0 or 1
// fill                         0xFF up to 0x40
// # 0x0040
// armorSectionPosition:4       0 when there is no armor block
// zeros:4                      only present with an armor block
// fill                         0xFF up to armorSectionPosition
// # armorSectionPosition
// contentLength:4, zeros:4
// sectionNameLength:4, zeros:4
// sectionNamePosition:4, zeros:4   relative to sectionNameLength
// content[
//     unknownA:36
//     numberOfPieces:4
//     piece{ id:4, unknownB:24, numberOfVertices:4, vertex{ xyz:12, unknownC:4 } }
// ]:contentLength
// sectionName:sectionNameLength    "CM_PA_united.armor\0"

inline constexpr size_t header_fill_len = 20;
inline constexpr size_t block_count_offset = 20;
inline constexpr size_t armor_section_pos_offset = 0x40;
inline constexpr size_t armor_section_start = 0x60;
inline constexpr size_t empty_container_size = armor_section_pos_offset + 4;

inline constexpr size_t unknown_a_len = 36;
inline constexpr size_t unknown_b_len = 24;
inline constexpr size_t unknown_c_len = 4;
inline constexpr uint8_t fill_byte = 0xFF;

// Section header: contentLength, sectionNameLength and sectionNamePosition,
// each followed by a 4-byte zero spacer.
inline constexpr size_t section_header_len = 24;
inline constexpr size_t section_name_length_field = 8; // relative to section start

inline constexpr size_t piece_header_len = 4 + unknown_b_len + 4;
inline constexpr size_t vertex_record_len = 12 + unknown_c_len;

// Includes the terminating NUL.
inline constexpr std::string_view section_name{"CM_PA_united.armor\0", 19};

// --- Record ---

using PieceId = uint32_t;

struct Vertex {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    bool operator==(const Vertex&) const = default;
};

using Triangle = std::array<Vertex, 3>;

struct Piece {
    PieceId id = 0;
    std::vector<Triangle> triangles;

    [[nodiscard]] size_t vertex_count() const { return triangles.size() * 3; }

    bool operator==(const Piece&) const = default;
};

// ArmorRecord keeps pieces in insertion order; the order is written to the
// wire as is.
struct ArmorRecord {
    std::vector<Piece> pieces;

    [[nodiscard]] bool empty() const { return pieces.empty(); }
    [[nodiscard]] const Piece* find(PieceId id) const;

    bool operator==(const ArmorRecord&) const = default;
};

struct ArmorContentMetadata {
    uint32_t size = 0;
    digest::MD5Digest hash{};

    bool operator==(const ArmorContentMetadata&) const = default;
};

// --- Errors ---

enum class ErrorKind {
    MalformedHeader,
    TruncatedContent,
    VertexCountNotMultipleOfThree,
    IdOverflow,
    HashMismatch,
    ContentLengthMismatch,
    MisalignedContent,
    SectionNameMismatch,
    DuplicatePieceId,
    CountOverflow,
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// checked_piece_id narrows an id coming from a wider source.
// Throws Error{IdOverflow} if it does not fit in 32 bits.
PieceId checked_piece_id(uint64_t id);

// --- Codec ---

struct Encoded {
    std::vector<uint8_t> bytes;
    ArmorContentMetadata metadata;
};

struct Decoded {
    ArmorRecord record;
    ArmorContentMetadata metadata;
};

struct DecodeOptions {
    // When set, the recomputed content hash must match.
    std::optional<digest::MD5Digest> expected_hash;
};

// content_length returns the size of the content region encode() would
// produce for r (0 for an empty record).
size_t content_length(const ArmorRecord& r);

// encoded_size returns the total buffer size encode() would produce for r.
size_t encoded_size(const ArmorRecord& r);

// encode serializes r into a container with zero or one armor block.
Encoded encode(const ArmorRecord& r);

// decode parses a container produced by encode() (or the game). Triangles
// are regrouped from the flat vertex stream in groups of three.
Decoded decode(const uint8_t* data, size_t size, const DecodeOptions& opts = {});
Decoded decode(const std::vector<uint8_t>& data, const DecodeOptions& opts = {});

} // namespace geometrytools::armor
