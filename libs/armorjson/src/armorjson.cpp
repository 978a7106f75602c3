#include "geometrytools/armorjson.h"

#include <charconv>
#include <format>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace geometrytools::armorjson {

static armor::PieceId parse_piece_id(const std::string& key) {
    if (key.empty())
        throw std::runtime_error("armorjson: empty piece id");

    uint64_t value = 0;
    auto [end, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
    if (ec == std::errc::result_out_of_range)
        throw armor::Error(armor::ErrorKind::IdOverflow,
                           std::format("armorjson: piece id {} does not fit in 32 bits", key));
    if (ec != std::errc() || end != key.data() + key.size())
        throw std::runtime_error(std::format("armorjson: piece id '{}' is not a number", key));

    return armor::checked_piece_id(value);
}

static armor::Vertex parse_vertex(const json& v, const std::string& key) {
    if (!v.is_array() || v.size() != 3)
        throw std::runtime_error(
            std::format("armorjson: piece {}: vertex must be an array of 3 numbers", key));
    for (const auto& c : v) {
        if (!c.is_number())
            throw std::runtime_error(
                std::format("armorjson: piece {}: vertex coordinate is not a number", key));
    }
    return armor::Vertex{v[0].get<float>(), v[1].get<float>(), v[2].get<float>()};
}

armor::ArmorRecord from_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("source"))
        throw std::runtime_error("armorjson: document has no \"source\" object");
    const auto& source = doc.at("source");
    if (!source.is_object())
        throw std::runtime_error("armorjson: \"source\" must be an object");

    armor::ArmorRecord r;
    r.pieces.reserve(source.size());
    for (const auto& item : source.items()) {
        const std::string& key = item.key();
        const json& tris = item.value();
        if (!tris.is_array())
            throw std::runtime_error(
                std::format("armorjson: piece {}: expected an array of triangles", key));

        armor::Piece p;
        p.id = parse_piece_id(key);
        p.triangles.reserve(tris.size());
        for (const auto& t : tris) {
            if (!t.is_array() || t.size() != 3)
                throw std::runtime_error(
                    std::format("armorjson: piece {}: triangle must have 3 vertices", key));
            p.triangles.push_back(
                armor::Triangle{parse_vertex(t[0], key), parse_vertex(t[1], key),
                                parse_vertex(t[2], key)});
        }
        r.pieces.push_back(std::move(p));
    }
    return r;
}

json to_json(const armor::ArmorRecord& r) {
    json source = json::object();
    for (const auto& p : r.pieces) {
        json tris = json::array();
        for (const auto& t : p.triangles) {
            json tri = json::array();
            for (const auto& v : t)
                tri.push_back(json::array({v.x, v.y, v.z}));
            tris.push_back(std::move(tri));
        }
        source[std::to_string(p.id)] = std::move(tris);
    }
    return json{{"source", std::move(source)}};
}

armor::ArmorRecord read_armor(std::istream& in) {
    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::format("armorjson: parse error: {}", e.what()));
    }
    return from_json(doc);
}

void write_armor(std::ostream& out, const armor::ArmorRecord& r, bool pretty) {
    auto doc = to_json(r);
    if (pretty)
        out << std::setw(2) << doc << '\n';
    else
        out << doc << '\n';
    if (!out)
        throw std::runtime_error("armorjson: failed to write armor document");
}

json metadata_to_json(const armor::ArmorContentMetadata& m) {
    return {
        {"armorContentLength", m.size},
        {"armorContentHash", digest::to_hex(m.hash)},
    };
}

} // namespace geometrytools::armorjson
