#include "geometrytools/armor.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace geometrytools::armor;
namespace digest = geometrytools::digest;

namespace {

// Absolute offsets inside an encoder-produced, non-empty container.
constexpr size_t content_length_at = armor_section_start;
constexpr size_t name_length_at = armor_section_start + 8;
constexpr size_t name_position_at = armor_section_start + 16;
constexpr size_t content_at = armor_section_start + section_header_len;

uint32_t u32_at(const std::vector<uint8_t>& buf, size_t off) {
    uint32_t v;
    std::memcpy(&v, buf.data() + off, 4);
    return v;
}

float f32_at(const std::vector<uint8_t>& buf, size_t off) {
    float v;
    std::memcpy(&v, buf.data() + off, 4);
    return v;
}

void put_u32(std::vector<uint8_t>& buf, size_t off, uint32_t v) {
    std::memcpy(buf.data() + off, &v, 4);
}

Triangle tri(Vertex a, Vertex b, Vertex c) {
    return Triangle{a, b, c};
}

ArmorRecord single_triangle() {
    ArmorRecord r;
    r.pieces.push_back(Piece{
        .id = 1,
        .triangles = {tri({0, 0, 0}, {1, 0, 0}, {0, 1, 0})},
    });
    return r;
}

ArmorRecord three_pieces() {
    ArmorRecord r;
    r.pieces.push_back(Piece{
        .id = 7,
        .triangles = {tri({1.5f, -2.0f, 3.25f}, {4, 5, 6}, {7, 8, 9}),
                      tri({-0.5f, 0.125f, 1e6f}, {0, 0, 0}, {1, 1, 1})},
    });
    r.pieces.push_back(Piece{.id = 2, .triangles = {}});
    r.pieces.push_back(Piece{
        .id = 4294967295u,
        .triangles = {tri({10, 20, 30}, {40, 50, 60}, {70, 80, 90})},
    });
    return r;
}

ErrorKind decode_error_kind(const std::vector<uint8_t>& buf, const DecodeOptions& opts = {}) {
    try {
        decode(buf, opts);
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode succeeded on a buffer expected to fail";
    return ErrorKind::MalformedHeader;
}

} // namespace

// --- Encoder layout ---

TEST(ArmorEncode, EmptyRecordShape) {
    auto enc = encode(ArmorRecord{});
    ASSERT_EQ(enc.bytes.size(), 0x44u);
    EXPECT_EQ(enc.bytes.size(), encoded_size(ArmorRecord{}));

    for (size_t i = 0; i < header_fill_len; i++)
        EXPECT_EQ(enc.bytes[i], 0xFF) << "offset " << i;
    EXPECT_EQ(u32_at(enc.bytes, block_count_offset), 0u);
    for (size_t i = block_count_offset + 4; i < armor_section_pos_offset; i++)
        EXPECT_EQ(enc.bytes[i], 0xFF) << "offset " << i;
    EXPECT_EQ(u32_at(enc.bytes, armor_section_pos_offset), 0u);

    EXPECT_EQ(enc.metadata.size, 0u);
    EXPECT_EQ(enc.metadata.hash, digest::md5_empty());
    EXPECT_EQ(digest::to_hex(enc.metadata.hash), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ArmorEncode, SingleTriangleLayout) {
    auto r = single_triangle();
    auto enc = encode(r);

    EXPECT_EQ(enc.metadata.size, 120u);
    EXPECT_EQ(content_length(r), 120u);
    ASSERT_EQ(enc.bytes.size(), content_at + 120 + section_name.size());
    EXPECT_EQ(enc.bytes.size(), encoded_size(r));

    EXPECT_EQ(u32_at(enc.bytes, block_count_offset), 1u);
    EXPECT_EQ(u32_at(enc.bytes, armor_section_pos_offset), 0x60u);
    EXPECT_EQ(u32_at(enc.bytes, armor_section_pos_offset + 4), 0u);
    for (size_t i = armor_section_pos_offset + 8; i < armor_section_start; i++)
        EXPECT_EQ(enc.bytes[i], 0xFF) << "offset " << i;

    // Piece count, then the only piece.
    size_t piece_count_at = content_at + unknown_a_len;
    EXPECT_EQ(u32_at(enc.bytes, piece_count_at), 1u);
    size_t piece_at = piece_count_at + 4;
    EXPECT_EQ(u32_at(enc.bytes, piece_at), 1u);
    EXPECT_EQ(u32_at(enc.bytes, piece_at + 4 + unknown_b_len), 3u);

    size_t vertex_at = piece_at + piece_header_len;
    EXPECT_EQ(f32_at(enc.bytes, vertex_at + vertex_record_len), 1.0f);
    EXPECT_EQ(f32_at(enc.bytes, vertex_at + 2 * vertex_record_len + 4), 1.0f);
}

TEST(ArmorEncode, OpaqueRegionsAreFilled) {
    auto enc = encode(single_triangle());
    for (size_t i = 0; i < unknown_a_len; i++)
        EXPECT_EQ(enc.bytes[content_at + i], 0xFF);

    size_t piece_at = content_at + unknown_a_len + 4;
    for (size_t i = 0; i < unknown_b_len; i++)
        EXPECT_EQ(enc.bytes[piece_at + 4 + i], 0xFF);

    size_t vertex_at = piece_at + piece_header_len;
    for (size_t v = 0; v < 3; v++) {
        for (size_t i = 0; i < unknown_c_len; i++)
            EXPECT_EQ(enc.bytes[vertex_at + v * vertex_record_len + 12 + i], 0xFF);
    }
}

TEST(ArmorEncode, SectionHeaderFields) {
    auto enc = encode(three_pieces());
    const auto& b = enc.bytes;

    EXPECT_EQ(u32_at(b, content_length_at), enc.metadata.size);
    EXPECT_EQ(u32_at(b, content_length_at + 4), 0u);
    EXPECT_EQ(u32_at(b, name_length_at), section_name.size());
    EXPECT_EQ(u32_at(b, name_length_at + 4), 0u);
    EXPECT_EQ(u32_at(b, name_position_at + 4), 0u);

    size_t name_at = name_length_at + u32_at(b, name_position_at);
    EXPECT_EQ(name_at, content_at + enc.metadata.size);
    ASSERT_EQ(name_at + section_name.size(), b.size());
    EXPECT_EQ(std::string(b.begin() + static_cast<std::ptrdiff_t>(name_at), b.end()),
              std::string(section_name));
}

TEST(ArmorEncode, MetadataMatchesContentSlice) {
    auto enc = encode(three_pieces());
    std::vector<uint8_t> slice(enc.bytes.begin() + content_at,
                               enc.bytes.begin() + content_at + enc.metadata.size);
    EXPECT_EQ(slice.size(), content_length(three_pieces()));
    EXPECT_EQ(digest::md5(slice), enc.metadata.hash);
    EXPECT_NE(enc.metadata.hash, digest::md5_empty());
}

TEST(ArmorEncode, PieceOrderChangesBytesOnly) {
    auto r = three_pieces();
    auto reversed = r;
    std::swap(reversed.pieces.front(), reversed.pieces.back());

    auto a = encode(r);
    auto b = encode(reversed);
    EXPECT_EQ(a.bytes.size(), b.bytes.size());
    EXPECT_NE(a.bytes, b.bytes);
    EXPECT_EQ(a.metadata.size, b.metadata.size);
}

TEST(ArmorEncode, DuplicatePieceIdRejected) {
    ArmorRecord r = single_triangle();
    r.pieces.push_back(r.pieces.front());
    try {
        encode(r);
        FAIL() << "expected DuplicatePieceId";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicatePieceId);
    }
}

TEST(ArmorEncode, CheckedPieceId) {
    EXPECT_EQ(checked_piece_id(0), 0u);
    EXPECT_EQ(checked_piece_id(4294967295ull), 4294967295u);
    try {
        checked_piece_id(4294967296ull);
        FAIL() << "expected IdOverflow";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IdOverflow);
        EXPECT_STREQ(error_kind_name(e.kind()), "IdOverflow");
    }
}

// --- Round trip ---

TEST(ArmorDecode, RoundTripEmpty) {
    auto enc = encode(ArmorRecord{});
    auto dec = decode(enc.bytes);
    EXPECT_TRUE(dec.record.empty());
    EXPECT_EQ(dec.metadata, enc.metadata);
}

TEST(ArmorDecode, RoundTripPreservesOrderAndVertices) {
    auto r = three_pieces();
    auto enc = encode(r);
    auto dec = decode(enc.bytes);

    EXPECT_EQ(dec.record, r);
    EXPECT_EQ(dec.metadata, enc.metadata);
    ASSERT_EQ(dec.record.pieces.size(), 3u);
    EXPECT_EQ(dec.record.pieces[0].id, 7u);
    EXPECT_EQ(dec.record.pieces[1].id, 2u);
    EXPECT_TRUE(dec.record.pieces[1].triangles.empty());
    ASSERT_NE(dec.record.find(4294967295u), nullptr);
    EXPECT_EQ(dec.record.find(4294967295u)->triangles[0][2], (Vertex{70, 80, 90}));
    EXPECT_EQ(dec.record.find(3), nullptr);
}

TEST(ArmorDecode, NonFiniteFloatsPassThrough) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    ArmorRecord r;
    r.pieces.push_back(Piece{.id = 5, .triangles = {tri({nan, inf, -inf}, {0, 0, 0}, {0, 0, 0})}});

    auto dec = decode(encode(r).bytes);
    const auto& v = dec.record.pieces[0].triangles[0][0];
    EXPECT_TRUE(std::isnan(v.x));
    EXPECT_EQ(v.y, inf);
    EXPECT_EQ(v.z, -inf);
}

TEST(ArmorDecode, ExpectedHashAccepted) {
    auto enc = encode(three_pieces());
    DecodeOptions opts{.expected_hash = enc.metadata.hash};
    EXPECT_NO_THROW(decode(enc.bytes, opts));

    auto empty = encode(ArmorRecord{});
    DecodeOptions empty_opts{.expected_hash = digest::md5_empty()};
    EXPECT_NO_THROW(decode(empty.bytes, empty_opts));
}

TEST(ArmorDecode, OpaqueRegionsIgnored) {
    auto r = single_triangle();
    auto enc = encode(r);
    for (size_t i = 0; i < unknown_a_len; i++)
        enc.bytes[content_at + i] = 0x00;
    for (size_t i = 0; i < armor_section_pos_offset; i++) {
        if (i < block_count_offset || i >= block_count_offset + 4)
            enc.bytes[i] = 0x11;
    }

    auto dec = decode(enc.bytes);
    EXPECT_EQ(dec.record, r);
    // The hash covers the bytes as they are in the buffer.
    EXPECT_NE(dec.metadata.hash, encode(r).metadata.hash);
    EXPECT_EQ(dec.metadata.size, 120u);
}

// --- Corruption ---

TEST(ArmorDecode, TruncationAlwaysFails) {
    for (const auto& r : {ArmorRecord{}, single_triangle(), three_pieces()}) {
        auto enc = encode(r);
        for (size_t cut = 1; cut <= enc.bytes.size(); cut++) {
            std::vector<uint8_t> truncated(enc.bytes.begin(),
                                           enc.bytes.end() - static_cast<std::ptrdiff_t>(cut));
            auto kind = decode_error_kind(truncated);
            EXPECT_TRUE(kind == ErrorKind::TruncatedContent || kind == ErrorKind::MalformedHeader)
                << "cut " << cut << " of " << enc.bytes.size() << ": " << error_kind_name(kind);
        }
    }
}

TEST(ArmorDecode, TruncatedHeaderIsMalformed) {
    auto enc = encode(single_triangle());
    std::vector<uint8_t> header_only(enc.bytes.begin(), enc.bytes.begin() + content_at - 1);
    EXPECT_EQ(decode_error_kind(header_only), ErrorKind::MalformedHeader);

    std::vector<uint8_t> into_content(enc.bytes.begin(), enc.bytes.begin() + content_at + 50);
    EXPECT_EQ(decode_error_kind(into_content), ErrorKind::TruncatedContent);
}

TEST(ArmorDecode, UnsupportedBlockCount) {
    auto enc = encode(single_triangle());
    put_u32(enc.bytes, block_count_offset, 2);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::MalformedHeader);
}

TEST(ArmorDecode, EmptyContainerWithSectionPointer) {
    auto enc = encode(ArmorRecord{});
    put_u32(enc.bytes, armor_section_pos_offset, 0x60);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::MalformedHeader);
}

TEST(ArmorDecode, SectionPointerPastEnd) {
    auto enc = encode(single_triangle());
    put_u32(enc.bytes, armor_section_pos_offset, 0x10000);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::MalformedHeader);
}

TEST(ArmorDecode, NonZeroSpacer) {
    auto enc = encode(single_triangle());
    put_u32(enc.bytes, content_length_at + 4, 1);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::MalformedHeader);
}

TEST(ArmorDecode, VertexCountNotMultipleOfThree) {
    auto enc = encode(single_triangle());
    size_t vertex_count_at = content_at + unknown_a_len + 4 + 4 + unknown_b_len;
    put_u32(enc.bytes, vertex_count_at, 2);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::VertexCountNotMultipleOfThree);
}

TEST(ArmorDecode, HugeVertexCountIsTruncation) {
    auto enc = encode(single_triangle());
    size_t vertex_count_at = content_at + unknown_a_len + 4 + 4 + unknown_b_len;
    put_u32(enc.bytes, vertex_count_at, 3u * 100000000u);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::TruncatedContent);
}

TEST(ArmorDecode, HugePieceCountIsTruncation) {
    auto enc = encode(single_triangle());
    put_u32(enc.bytes, content_at + unknown_a_len, 0xFFFFFFFF);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::TruncatedContent);
}

TEST(ArmorDecode, ContentLengthMismatch) {
    auto enc = encode(single_triangle());
    put_u32(enc.bytes, content_length_at, enc.metadata.size + 4);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::ContentLengthMismatch);
}

TEST(ArmorDecode, MisalignedSectionName) {
    auto enc = encode(single_triangle());
    put_u32(enc.bytes, name_position_at, u32_at(enc.bytes, name_position_at) - 4);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::MisalignedContent);
}

TEST(ArmorDecode, WrongSectionName) {
    auto enc = encode(single_triangle());
    enc.bytes[enc.bytes.size() - 2] = 'x';
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::SectionNameMismatch);
}

TEST(ArmorDecode, DuplicatePieceIdInBuffer) {
    ArmorRecord r = single_triangle();
    r.pieces.push_back(Piece{.id = 9, .triangles = r.pieces[0].triangles});
    auto enc = encode(r);
    size_t second_piece_at = content_at + unknown_a_len + 4 + piece_header_len + 3 * vertex_record_len;
    ASSERT_EQ(u32_at(enc.bytes, second_piece_at), 9u);
    put_u32(enc.bytes, second_piece_at, 1);
    EXPECT_EQ(decode_error_kind(enc.bytes), ErrorKind::DuplicatePieceId);
}

TEST(ArmorDecode, HashMismatch) {
    auto enc = encode(single_triangle());
    DecodeOptions opts{.expected_hash = digest::md5_empty()};
    EXPECT_EQ(decode_error_kind(enc.bytes, opts), ErrorKind::HashMismatch);

    auto empty = encode(ArmorRecord{});
    DecodeOptions wrong{.expected_hash = enc.metadata.hash};
    EXPECT_EQ(decode_error_kind(empty.bytes, wrong), ErrorKind::HashMismatch);
}
