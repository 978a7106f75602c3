#include "geometrytools/armor.h"
#include "geometrytools/binutil.h"

#include <format>
#include <limits>
#include <unordered_set>
#include <utility>

namespace geometrytools::armor {

static constexpr size_t u32_max = std::numeric_limits<uint32_t>::max();

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedHeader: return "MalformedHeader";
        case ErrorKind::TruncatedContent: return "TruncatedContent";
        case ErrorKind::VertexCountNotMultipleOfThree: return "VertexCountNotMultipleOfThree";
        case ErrorKind::IdOverflow: return "IdOverflow";
        case ErrorKind::HashMismatch: return "HashMismatch";
        case ErrorKind::ContentLengthMismatch: return "ContentLengthMismatch";
        case ErrorKind::MisalignedContent: return "MisalignedContent";
        case ErrorKind::SectionNameMismatch: return "SectionNameMismatch";
        case ErrorKind::DuplicatePieceId: return "DuplicatePieceId";
        case ErrorKind::CountOverflow: return "CountOverflow";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

PieceId checked_piece_id(uint64_t id) {
    if (id > u32_max)
        throw Error(ErrorKind::IdOverflow,
                    std::format("armor: piece id {} does not fit in 32 bits", id));
    return static_cast<PieceId>(id);
}

const Piece* ArmorRecord::find(PieceId id) const {
    for (const auto& p : pieces) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

size_t content_length(const ArmorRecord& r) {
    if (r.empty()) return 0;
    size_t len = unknown_a_len + 4;
    for (const auto& p : r.pieces)
        len += piece_header_len + p.vertex_count() * vertex_record_len;
    return len;
}

size_t encoded_size(const ArmorRecord& r) {
    if (r.empty()) return empty_container_size;
    return armor_section_start + section_header_len + content_length(r) + section_name.size();
}

// --- Encoding ---

static void check_encodable(const ArmorRecord& r) {
    if (r.pieces.size() > u32_max)
        throw Error(ErrorKind::CountOverflow,
                    std::format("armor: too many pieces ({})", r.pieces.size()));

    std::unordered_set<PieceId> seen;
    seen.reserve(r.pieces.size());
    for (const auto& p : r.pieces) {
        if (!seen.insert(p.id).second)
            throw Error(ErrorKind::DuplicatePieceId,
                        std::format("armor: piece id {} appears more than once", p.id));
        if (p.vertex_count() > u32_max)
            throw Error(ErrorKind::CountOverflow,
                        std::format("armor: piece {} has too many vertices ({})",
                                    p.id, p.vertex_count()));
    }

    // sectionNamePosition is the largest field derived from the content size.
    if (section_header_len - section_name_length_field + content_length(r) > u32_max)
        throw Error(ErrorKind::CountOverflow,
                    std::format("armor: content region too large ({} bytes)", content_length(r)));
}

static std::vector<uint8_t> encode_content(const ArmorRecord& r) {
    binutil::Writer w(content_length(r));
    w.fill(fill_byte, unknown_a_len);
    w.write_u32(static_cast<uint32_t>(r.pieces.size()));
    for (const auto& p : r.pieces) {
        w.write_u32(p.id);
        w.fill(fill_byte, unknown_b_len);
        w.write_u32(static_cast<uint32_t>(p.vertex_count()));
        for (const auto& tri : p.triangles) {
            for (const auto& v : tri) {
                w.write_f32(v.x);
                w.write_f32(v.y);
                w.write_f32(v.z);
                w.fill(fill_byte, unknown_c_len);
            }
        }
    }
    return w.take();
}

Encoded encode(const ArmorRecord& r) {
    binutil::Writer w(encoded_size(r));
    w.fill(fill_byte, header_fill_len);

    if (r.empty()) {
        w.write_u32(0);
        w.pad_to(armor_section_pos_offset, fill_byte);
        w.write_u32(0);
        return Encoded{
            .bytes = w.take(),
            .metadata = {.size = 0, .hash = digest::md5_empty()},
        };
    }

    check_encodable(r);

    // The content region is built first so the section header can be
    // written with its final values.
    std::vector<uint8_t> content = encode_content(r);
    auto content_size = static_cast<uint32_t>(content.size());
    auto name_position = static_cast<uint32_t>(
        section_header_len - section_name_length_field + content.size());

    w.write_u32(1);
    w.pad_to(armor_section_pos_offset, fill_byte);
    w.write_u32(static_cast<uint32_t>(armor_section_start));
    w.write_u32(0);
    w.pad_to(armor_section_start, fill_byte);

    w.write_u32(content_size);
    w.write_u32(0);
    w.write_u32(static_cast<uint32_t>(section_name.size()));
    w.write_u32(0);
    w.write_u32(name_position);
    w.write_u32(0);

    w.append(content);
    w.write_bytes(section_name.data(), section_name.size());

    return Encoded{
        .bytes = w.take(),
        .metadata = {.size = content_size, .hash = digest::md5(content)},
    };
}

// --- Decoding ---

static uint32_t read_header_u32(binutil::Reader& r, const char* field) {
    try {
        return r.read_u32();
    } catch (const binutil::EndOfData& e) {
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: truncated header reading {}: {}", field, e.what()));
    }
}

static void expect_header_zeros(binutil::Reader& r, const char* field) {
    size_t at = r.tell();
    bool zero = false;
    try {
        zero = r.read_zeros(4);
    } catch (const binutil::EndOfData& e) {
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: truncated header after {}: {}", field, e.what()));
    }
    if (!zero)
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: expected zero spacer after {} at offset {}", field, at));
}

static Piece read_piece(binutil::Reader& r, std::unordered_set<PieceId>& seen) {
    Piece p;
    p.id = r.read_u32();
    if (!seen.insert(p.id).second)
        throw Error(ErrorKind::DuplicatePieceId,
                    std::format("armor: piece id {} appears more than once", p.id));

    r.skip(unknown_b_len);
    uint32_t vertex_count = r.read_u32();
    if (vertex_count % 3 != 0)
        throw Error(ErrorKind::VertexCountNotMultipleOfThree,
                    std::format("armor: piece {} has {} vertices, not a multiple of 3",
                                p.id, vertex_count));
    if (vertex_count > r.remaining() / vertex_record_len)
        throw Error(ErrorKind::TruncatedContent,
                    std::format("armor: piece {} declares {} vertices but only {} bytes remain",
                                p.id, vertex_count, r.remaining()));

    p.triangles.resize(vertex_count / 3);
    for (auto& tri : p.triangles) {
        for (auto& v : tri) {
            v = Vertex{r.read_f32(), r.read_f32(), r.read_f32()};
            r.skip(unknown_c_len);
        }
    }
    return p;
}

static ArmorRecord read_content(binutil::Reader& r) {
    ArmorRecord record;
    try {
        r.skip(unknown_a_len);
        uint32_t piece_count = r.read_u32();
        if (piece_count > r.remaining() / piece_header_len)
            throw Error(ErrorKind::TruncatedContent,
                        std::format("armor: {} pieces declared but only {} bytes remain",
                                    piece_count, r.remaining()));

        std::unordered_set<PieceId> seen;
        seen.reserve(piece_count);
        record.pieces.reserve(piece_count);
        for (uint32_t i = 0; i < piece_count; i++)
            record.pieces.push_back(read_piece(r, seen));
    } catch (const binutil::EndOfData& e) {
        throw Error(ErrorKind::TruncatedContent,
                    std::format("armor: truncated content region: {}", e.what()));
    }
    return record;
}

static void verify_hash(const DecodeOptions& opts, const digest::MD5Digest& actual) {
    if (opts.expected_hash && *opts.expected_hash != actual)
        throw Error(ErrorKind::HashMismatch,
                    std::format("armor: content hash mismatch: expected {}, got {}",
                                digest::to_hex(*opts.expected_hash), digest::to_hex(actual)));
}

Decoded decode(const uint8_t* data, size_t size, const DecodeOptions& opts) {
    binutil::Reader r(data, size);

    try {
        r.seek(block_count_offset);
    } catch (const binutil::EndOfData& e) {
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: buffer too short for block count: {}", e.what()));
    }
    uint32_t block_count = read_header_u32(r, "block count");
    if (block_count > 1)
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: unsupported number of armor blocks: {}", block_count));

    try {
        r.seek(armor_section_pos_offset);
    } catch (const binutil::EndOfData& e) {
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: buffer too short for armor section position: {}",
                                e.what()));
    }
    uint32_t section_pos = read_header_u32(r, "armor section position");

    if (block_count == 0) {
        if (section_pos != 0)
            throw Error(ErrorKind::MalformedHeader,
                        std::format("armor: no armor block but section position is {:#x}",
                                    section_pos));
        verify_hash(opts, digest::md5_empty());
        return Decoded{
            .record = {},
            .metadata = {.size = 0, .hash = digest::md5_empty()},
        };
    }

    expect_header_zeros(r, "armor section position");
    if (section_pos < r.tell())
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: armor section position {:#x} overlaps the file header",
                                section_pos));
    try {
        r.seek(section_pos);
    } catch (const binutil::EndOfData& e) {
        throw Error(ErrorKind::MalformedHeader,
                    std::format("armor: armor section position {:#x} past end: {}",
                                section_pos, e.what()));
    }

    uint32_t stored_length = read_header_u32(r, "content length");
    expect_header_zeros(r, "content length");
    size_t name_length_field_pos = r.tell();
    uint32_t name_length = read_header_u32(r, "section name length");
    expect_header_zeros(r, "section name length");
    uint32_t name_position = read_header_u32(r, "section name position");
    expect_header_zeros(r, "section name position");

    size_t content_start = r.tell();
    ArmorRecord record = read_content(r);
    size_t content_end = r.tell();

    size_t expected_end = name_length_field_pos + name_position;
    if (content_end != expected_end)
        throw Error(ErrorKind::MisalignedContent,
                    std::format("armor: misaligned after content region: expected offset {}, at {}",
                                expected_end, content_end));

    size_t measured = content_end - content_start;
    if (measured != stored_length)
        throw Error(ErrorKind::ContentLengthMismatch,
                    std::format("armor: content length field is {}, content region is {} bytes",
                                stored_length, measured));

    if (name_length > r.remaining())
        throw Error(ErrorKind::TruncatedContent,
                    std::format("armor: section name of {} bytes but only {} bytes remain",
                                name_length, r.remaining()));
    std::string name = r.read_fixed_string(name_length);
    if (name != section_name)
        throw Error(ErrorKind::SectionNameMismatch,
                    std::format("armor: unexpected section name '{}'", name));

    auto hash = digest::md5(data + content_start, measured);
    verify_hash(opts, hash);

    return Decoded{
        .record = std::move(record),
        .metadata = {.size = static_cast<uint32_t>(measured), .hash = hash},
    };
}

Decoded decode(const std::vector<uint8_t>& data, const DecodeOptions& opts) {
    return decode(data.data(), data.size(), opts);
}

} // namespace geometrytools::armor
