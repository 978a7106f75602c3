#include "geometrytools/armor.h"
#include "geometrytools/armorjson.h"
#include "geometrytools/digest.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
namespace armor = geometrytools::armor;
namespace armorjson = geometrytools::armorjson;
namespace digest = geometrytools::digest;

static void print_usage() {
    geometrytools::cli::print("Usage: geometry2armor [flags] <input.geometry>");
    geometrytools::cli::print("Extracts the armor section of a .geometry container as JSON.");
    geometrytools::cli::print("");
    geometrytools::cli::print("Flags:");
    geometrytools::cli::print("  -o <path>           Output JSON path (default: <input>.json)");
    geometrytools::cli::print("  --expect-md5 <hex>  Fail unless the armor content MD5 matches");
    geometrytools::cli::print("  --pretty            Pretty-print JSON output");
    geometrytools::cli::print("  --meta <path>       Write content metadata JSON to path");
    geometrytools::cli::print("  --force             Overwrite an existing output file");
    geometrytools::cli::print("  -v, --verbose       Verbose logging (-vv for debug)");
}

static std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path.string());
    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) throw std::runtime_error("failed to read " + path.string());
    return buf;
}

int main(int argc, char* argv[]) {
    std::string output;
    std::string meta_path;
    std::string expect_md5;
    bool pretty = false;
    bool force = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--meta") == 0 && i + 1 < argc) {
            meta_path = argv[++i];
        } else if (std::strcmp(argv[i], "--expect-md5") == 0 && i + 1 < argc) {
            expect_md5 = argv[++i];
        } else if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
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

    armor::DecodeOptions opts;
    if (!expect_md5.empty()) {
        opts.expected_hash = digest::parse_hex(expect_md5);
        if (!opts.expected_hash) {
            LOGE("--expect-md5 needs 32 hex digits, got", expect_md5);
            return 2;
        }
    }

    fs::path in_path = positional[0];
    fs::path out_path = output;
    if (out_path.empty())
        out_path = in_path.parent_path() / (in_path.stem().string() + ".json");

    if (fs::exists(out_path) && !force) {
        LOGE("output exists (use --force):", out_path.string());
        return 1;
    }

    armor::Decoded dec;
    try {
        auto buf = read_file(in_path);
        LOGI("Reading", in_path.string(), buf.size(), "bytes");
        dec = armor::decode(buf, opts);
    } catch (const armor::Error& e) {
        LOGE("decoding", in_path.string(), armor::error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOGE("reading", in_path.string(), e.what());
        return 1;
    }

    if (dec.record.empty())
        LOGW(in_path.string(), "has no armor block");

    try {
        std::ofstream out(out_path);
        if (!out) throw std::runtime_error("failed to create " + out_path.string());
        armorjson::write_armor(out, dec.record, pretty);
        LOGI("Wrote", out_path.string());

        if (!meta_path.empty()) {
            std::ofstream mf(meta_path);
            if (!mf) throw std::runtime_error("failed to create " + meta_path);
            mf << std::setw(2) << armorjson::metadata_to_json(dec.metadata) << '\n';
            if (!mf) throw std::runtime_error("failed to write " + meta_path);
            LOGI("Metadata:", meta_path);
        }
    } catch (const std::exception& e) {
        LOGE("writing output:", e.what());
        return 1;
    }

    LOGI("Pieces:", dec.record.pieces.size());
    LOGI("Content length:", dec.metadata.size);
    LOGI("MD5:", digest::to_hex(dec.metadata.hash));
    return 0;
}
