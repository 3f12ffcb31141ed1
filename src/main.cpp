/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_fingerprint.h"
#include "jsb_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    std::string command;
    fs::path input;
    std::optional<fs::path> layout_path;
    std::optional<std::string> season;
    std::optional<fs::path> offsets_path;
    std::optional<fs::path> edits_path;
    std::optional<fs::path> expected_path;
    std::optional<fs::path> out_path;
    std::optional<std::size_t> copy;
    bool strict = false;
    bool debug = false;
};

static void print_usage() {
    FM_LOG_INFO(
        "Usage:\n" \
        "    jsb_parser <command> <file.jsb> [options] [--debug]\n\n" \
        "Commands:\n" \
        "    decode-season   --layout <layout.json> --season <id> [--out <json>]\n" \
        "    decode-copies   --offsets <table.json> [--copy <n>] [--out <json>]\n" \
        "    decode-weights  [--out <json>]\n" \
        "    patch           --offsets <table.json> --edits <edits.json> [--out <file>] [--strict]\n" \
        "    compare         --offsets <table.json>\n" \
        "    verify          --offsets <table.json> --expected <values.json>\n" \
        "    fingerprint\n\n" \
        "Options:\n" \
        "    --strict      a file that does not match the table's BLAKE3 digest is an error\n" \
        "    --debug       enables extra logging\n"
    );
    FM_LOG_INFO("[INFO] Without --out, results are written below <exe dir>/output.");
}

static bool is_known_command(std::string_view cmd) {
    return cmd == "decode-season" || cmd == "decode-copies" || cmd == "decode-weights" || cmd == "patch"
           || cmd == "compare" || cmd == "verify" || cmd == "fingerprint";
}

static fs::path default_output(const Settings& settings, const std::string& suffix, const char* subdir) {
    const fs::path out_dir = fm::fs_utils::executable_dir() / "output" / subdir;
    fm::fs_utils::ensure_dir(out_dir);
    return out_dir / (settings.input.stem().string() + suffix);
}

static void write_json(const Settings& settings, const nlohmann::ordered_json& j, const std::string& suffix) {
    const fs::path path = settings.out_path.has_value() ? *settings.out_path
                                                        : default_output(settings, suffix, "json");
    fm::fs_utils::write_text_file(path, j.dump(2));
    FM_LOG_INFO("Wrote: %s", path.string().c_str());
}

static bool require(const Settings& settings, bool present, const char* flag) {
    if (!present) {
        FM_LOG_ERROR("%s requires %s", settings.command.c_str(), flag);
        return false;
    }
    return true;
}

static int run_command(const Settings& settings) {
    using fm::jsb::JsbParser;

    fm::jsb::ParserOptions opt{};
    opt.strict = settings.strict;

    const auto bytes = fm::fs_utils::read_file(settings.input);
    if (bytes.empty()) {
        throw std::runtime_error("Container file is empty: " + settings.input.string());
    }

    if (settings.command == "fingerprint") {
        FM_LOG_INFO("%s  %s", fm::jsb::fingerprint(bytes).c_str(), settings.input.string().c_str());
        return 0;
    }

    if (settings.command == "decode-season") {
        const auto anchors = fm::jsb::load_season_anchors(*settings.layout_path, *settings.season);
        const auto res = JsbParser::DecodeSeasonBytes(bytes, anchors, *settings.season);
        write_json(settings, res.record, "_" + *settings.season + ".json");
        return 0;
    }

    if (settings.command == "decode-weights") {
        write_json(settings, JsbParser::DecodeWeightsBytes(bytes), ".json");
        return 0;
    }

    const auto table = fm::jsb::load_offset_table(*settings.offsets_path);

    if (settings.command == "decode-copies") {
        const auto res = JsbParser::DecodeCopies(bytes, table, opt);
        if (settings.copy.has_value()) {
            if (*settings.copy >= res.json.size()) {
                throw std::runtime_error(
                    "Copy " + std::to_string(*settings.copy) + " does not exist, table has "
                    + std::to_string(res.json.size())
                );
            }
            write_json(settings, res.json.at(*settings.copy), "_copy" + std::to_string(*settings.copy) + ".json");
            return 0;
        }
        write_json(settings, res.json, ".json");
        return 0;
    }

    if (settings.command == "patch") {
        const auto edits = fm::jsb::edits_from_json(fm::fs_utils::read_json_file(*settings.edits_path));
        const auto res = JsbParser::PatchBytes(bytes, table, edits, opt);
        const fs::path path = settings.out_path.has_value()
                                  ? *settings.out_path
                                  : default_output(settings, settings.input.extension().string(), "jsb");
        fm::fs_utils::write_file(path, res.bytes);
        FM_LOG_INFO("Wrote: %s", path.string().c_str());
        return 0;
    }

    if (settings.command == "compare") {
        return JsbParser::CompareCopies(bytes, table, opt).ok ? 0 : 1;
    }

    // verify
    const auto expected = fm::jsb::expected_from_json(fm::fs_utils::read_json_file(*settings.expected_path));
    return JsbParser::VerifyExpected(bytes, table, expected, opt).ok ? 0 : 1;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 2;
    }

    Settings settings;
    settings.command = argv[1];
    if (!is_known_command(settings.command)) {
        FM_LOG_ERROR("Unknown command: %s", settings.command.c_str());
        print_usage();
        return 2;
    }
    const std::string_view second_arg = argv[2];
    if (!second_arg.empty() && second_arg[0] == '-') {
        FM_LOG_ERROR("Second argument must be a .jsb file.");
        print_usage();
        return 2;
    }
    settings.input = fs::path(std::string(second_arg));

    for (int i = 3; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--strict") {
            settings.strict = true;
            continue;
        }
        const bool takes_value = arg == "--layout" || arg == "--season" || arg == "--offsets"
                                 || arg == "--edits" || arg == "--expected" || arg == "--out"
                                 || arg == "--copy";
        if (!takes_value) {
            FM_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            return 2;
        }
        if (i + 1 >= argc) {
            FM_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
            return 2;
        }
        const std::string value = argv[++i];
        if (arg == "--layout") {
            settings.layout_path = fs::path(value);
        } else if (arg == "--season") {
            settings.season = value;
        } else if (arg == "--offsets") {
            settings.offsets_path = fs::path(value);
        } else if (arg == "--edits") {
            settings.edits_path = fs::path(value);
        } else if (arg == "--expected") {
            settings.expected_path = fs::path(value);
        } else if (arg == "--out") {
            settings.out_path = fs::path(value);
        } else {
            try {
                settings.copy = static_cast<std::size_t>(std::stoul(value));
            } catch (const std::exception&) {
                FM_LOG_ERROR("Invalid value for --copy: %s", value.c_str());
                return 2;
            }
        }
    }

    const auto& cmd = settings.command;
    bool ok = true;
    if (cmd == "decode-season") {
        ok = require(settings, settings.layout_path.has_value(), "--layout");
        if (ok && !settings.season.has_value()) {
            FM_LOG_ERROR("decode-season requires --season, seasons in %s:", settings.layout_path->string().c_str());
            try {
                for (const auto& name : fm::jsb::list_seasons(*settings.layout_path)) {
                    FM_LOG_INFO("    %s", name.c_str());
                }
            } catch (const std::exception& e) {
                FM_LOG_ERROR("Could not read layout: %s", e.what());
            }
            ok = false;
        }
    } else if (cmd == "decode-copies" || cmd == "compare") {
        ok = require(settings, settings.offsets_path.has_value(), "--offsets");
    } else if (cmd == "patch") {
        ok = require(settings, settings.offsets_path.has_value(), "--offsets")
             && require(settings, settings.edits_path.has_value(), "--edits");
    } else if (cmd == "verify") {
        ok = require(settings, settings.offsets_path.has_value(), "--offsets")
             && require(settings, settings.expected_path.has_value(), "--expected");
    }
    if (!ok) {
        return 2;
    }

    if (!fs::exists(settings.input)) {
        FM_LOG_ERROR("Input does not exist: %s", settings.input.string().c_str());
        return 2;
    }

    fm::log::set_debug(settings.debug);

    try {
        return run_command(settings);
    } catch (const std::exception& e) {
        FM_LOG_ERROR("Failed: %s (%s)", settings.input.string().c_str(), e.what());
        return 1;
    }
}
