#include "geometrytools/armor.h"
#include "geometrytools/armorjson.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
namespace armor = geometrytools::armor;
namespace armorjson = geometrytools::armorjson;

static void print_usage() {
    geometrytools::cli::print("Usage: armor2geometry [flags] <input.json>");
    geometrytools::cli::print("Encodes an armor JSON document into a .geometry container.");
    geometrytools::cli::print("");
    geometrytools::cli::print("Flags:");
    geometrytools::cli::print("  -o <path>      Output .geometry path (default: <input>.geometry)");
    geometrytools::cli::print("  --meta <path>  Write content metadata JSON to path");
    geometrytools::cli::print("  --json         Print content metadata JSON to stdout");
    geometrytools::cli::print("  --force        Overwrite an existing output file");
    geometrytools::cli::print("  -v, --verbose  Verbose logging (-vv for debug)");
}

static void write_metadata(const fs::path& path, const armorjson::json& doc) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("failed to create " + path.string());
    f << std::setw(2) << doc << '\n';
    if (!f) throw std::runtime_error("failed to write " + path.string());
}

int main(int argc, char* argv[]) {
    std::string output;
    std::string meta_path;
    bool json_stdout = false;
    bool force = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--meta") == 0 && i + 1 < argc) {
            meta_path = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_stdout = true;
        } else if (std::strcmp(argv[i], "--force") == 0) {
            force = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    geometrytools::cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 2;
    }

    fs::path in_path = positional[0];
    fs::path out_path = output;
    if (out_path.empty())
        out_path = in_path.parent_path() / (in_path.stem().string() + ".geometry");

    if (fs::exists(out_path) && !force) {
        LOGE("output exists (use --force):", out_path.string());
        return 1;
    }

    std::ifstream in(in_path);
    if (!in) {
        LOGE("cannot open", in_path.string());
        return 1;
    }
    LOGI("Reading", in_path.string());

    armor::Encoded enc;
    try {
        auto record = armorjson::read_armor(in);
        LOGI("Pieces:", record.pieces.size());
        if (geometrytools::cli::debug_enabled()) {
            for (const auto& p : record.pieces)
                geometrytools::log::debug("piece", p.id, "vertices", p.vertex_count());
        }
        enc = armor::encode(record);
    } catch (const armor::Error& e) {
        LOGE("encoding", in_path.string(), armor::error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOGE("reading", in_path.string(), e.what());
        return 1;
    }

    auto meta = armorjson::metadata_to_json(enc.metadata);

    try {
        std::ofstream out(out_path, std::ios::binary);
        if (!out) throw std::runtime_error("failed to create " + out_path.string());
        out.write(reinterpret_cast<const char*>(enc.bytes.data()),
                  static_cast<std::streamsize>(enc.bytes.size()));
        if (!out) throw std::runtime_error("failed to write " + out_path.string());
        LOGI("Wrote", out_path.string(), enc.bytes.size(), "bytes");

        if (!meta_path.empty()) {
            write_metadata(meta_path, meta);
            LOGI("Metadata:", meta_path);
        }
    } catch (const std::exception& e) {
        LOGE("writing output:", e.what());
        return 1;
    }

    if (json_stdout)
        std::cout << meta << '\n';

    LOGI("Content length:", enc.metadata.size);
    LOGI("MD5:", meta["armorContentHash"].get<std::string>());
    return 0;
}
