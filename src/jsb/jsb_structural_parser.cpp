/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_structural_parser.h"

#include "jsb/jsb_byte_reader.h"
#include "jsb/jsb_errors.h"
#include "jsb/jsb_resync.h"
#include "jsb/jsb_value_codec.h"
#include "utils/log.h"

#include <algorithm>
#include <cstdio>
#include <string_view>

namespace fm::jsb {
namespace {
std::string hex_byte(std::uint8_t b) {
    char tmp[8];
    std::snprintf(tmp, sizeof(tmp), "0x%02X", static_cast<unsigned>(b));
    return tmp;
}

std::string row_context(const std::string& key, std::size_t row) {
    char tmp[16];
    std::snprintf(tmp, sizeof(tmp), " row %02zu", row);
    return key + tmp;
}

// Position of `needle` in buf[from, limit), or npos.
std::size_t find_bytes(
    std::span<const std::uint8_t> buf,
    std::string_view needle,
    std::size_t from,
    std::size_t limit
) {
    if (needle.empty() || from >= limit || limit - from < needle.size()) {
        return std::string_view::npos;
    }
    const auto first = buf.begin() + static_cast<std::ptrdiff_t>(from);
    const auto last = buf.begin() + static_cast<std::ptrdiff_t>(limit);
    const auto it = std::search(first, last, needle.begin(), needle.end(), [](std::uint8_t a, char b) {
        return a == static_cast<std::uint8_t>(b);
    });
    if (it == last) {
        return std::string_view::npos;
    }
    return static_cast<std::size_t>(it - buf.begin());
}

// Strips the string header in front of a coefficient label.
std::string clean_label(std::span<const std::uint8_t> raw) {
    if (raw.empty()) {
        return {};
    }
    const std::uint8_t tag = raw[0];
    if (tag == marker::kLongString && raw.size() >= 5) {
        raw = raw.subspan(5);
    } else if (tag >= 0x80 || tag == 0x68) {
        raw = raw.subspan(1);
    } else {
        while (!raw.empty() && raw[0] < 32) {
            raw = raw.subspan(1);
        }
    }
    return lossy_utf8(raw);
}

bool kind_matches(FieldKind want, const Token& tok) {
    if (want == FieldKind::String) {
        return tok.kind == TokenKind::String;
    }
    return tok.is_int();
}

const char* field_kind_name(FieldKind kind) {
    return kind == FieldKind::String ? "str" : "i32|i64";
}
}  // namespace

void StructuralParser::warn(std::string message) {
    FM_LOG_WARN("%s", message.c_str());
    _report.warnings.push_back(std::move(message));
}

void StructuralParser::expect_key_text(const std::string& key, std::size_t anchor) const {
    if (anchor >= _buf.size() || _buf.size() - anchor < key.size()
        || !std::equal(key.begin(), key.end(), _buf.begin() + static_cast<std::ptrdiff_t>(anchor), [](char a, std::uint8_t b) {
               return static_cast<std::uint8_t>(a) == b;
           })) {
        throw_codec_error(
            ErrorKind::TokenMismatch, "anchor does not point at key text '" + key + "'", _buf,
            std::min(anchor, _buf.empty() ? 0 : _buf.size() - 1)
        );
    }
}

std::size_t StructuralParser::body_start(
    const ShapeDescriptor& shape,
    std::size_t anchor,
    std::optional<std::uint32_t>* declared
) const {
    expect_key_text(shape.key, anchor);
    ByteReader r(_buf, anchor + shape.key.size());
    const std::size_t marker_at = r.position();
    const std::uint8_t ctl = r.read_u8();
    if (std::find(shape.object_markers.begin(), shape.object_markers.end(), ctl)
        != shape.object_markers.end()) {
        return r.position();
    }
    if (ctl == marker::kArray && shape.allow_array_container) {
        const std::uint32_t count = r.read_u32_le();
        if (declared != nullptr) {
            *declared = count;
        }
        FM_LOG_DEBUG(
            "%s: array marker, %u declared element(s), body @%s", shape.key.c_str(), count,
            hex_offset(r.position()).c_str()
        );
        return r.position();
    }
    throw_codec_error(
        ErrorKind::UnknownMarker, shape.key + ": unknown container marker " + hex_byte(ctl), _buf,
        marker_at
    );
}

Token StructuralParser::expect(TokenStream& ts, const FieldSpec& field, const std::string& ctx) const {
    auto tok = ts.next();
    if (!tok.has_value()) {
        throw_codec_error(
            ErrorKind::TruncatedOrCorrupt,
            ctx + ": unexpected end of stream while expecting '" + field.name + "'", _buf,
            std::min(ts.position(), _buf.empty() ? 0 : _buf.size() - 1)
        );
    }
    if (tok->key != field.name || !kind_matches(field.kind, *tok)) {
        throw_codec_error(
            ErrorKind::TokenMismatch,
            ctx + ": wanted (" + field.name + "," + field_kind_name(field.kind) + ") got (" + tok->key
                + "," + token_kind_name(tok->kind) + ") value " + tok->describe_value(),
            _buf, tok->key_offset
        );
    }
    return *tok;
}

nlohmann::ordered_json
StructuralParser::parse(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop) {
    if (anchor >= _buf.size() || stop > _buf.size() || stop < anchor) {
        throw CodecError(
            ErrorKind::InvalidOffsets,
            shape.key + ": anchor " + hex_offset(anchor) + " / stop " + hex_offset(stop)
                + " invalid for a " + std::to_string(_buf.size()) + "-byte buffer",
            anchor
        );
    }
    switch (shape.kind) {
        case ShapeKind::FixedRowTable:
            return parse_fixed_rows(shape, anchor, stop);
        case ShapeKind::BlockArray:
            return parse_block_array(shape, anchor, stop);
        case ShapeKind::IndexTable:
            return parse_index_table(shape, anchor, stop);
        case ShapeKind::Scalar:
            return parse_scalar(shape, anchor);
        case ShapeKind::KeyedObject:
            return parse_keyed_object(shape, anchor);
    }
    throw std::logic_error("unhandled shape kind");
}

nlohmann::ordered_json
StructuralParser::parse_layout(const RecordLayout& layout, const SectionAnchors& anchors) {
    std::vector<std::size_t> starts;
    starts.reserve(layout.sections.size());
    for (const auto& section : layout.sections) {
        const auto it = anchors.find(section.name);
        if (it == anchors.end()) {
            throw CodecError(
                ErrorKind::InvalidOffsets, layout.name + ": no anchor for section '" + section.name + "'",
                0
            );
        }
        if (it->second >= _buf.size()) {
            throw CodecError(
                ErrorKind::InvalidOffsets,
                layout.name + ": anchor of '" + section.name + "' lies outside the "
                    + std::to_string(_buf.size()) + "-byte buffer",
                it->second
            );
        }
        starts.push_back(it->second);
    }

    FM_LOG_INFO("Decoding %s at offsets:", layout.name.c_str());
    for (std::size_t i = 0; i < layout.sections.size(); i++) {
        FM_LOG_INFO(
            "  %-20s: %s (%s)", layout.sections[i].name.c_str(), hex_offset(starts[i]).c_str(),
            shape_kind_name(layout.sections[i].shape.kind)
        );
    }

    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (std::size_t i = 0; i < layout.sections.size(); i++) {
        const std::size_t stop = i + 1 < starts.size() ? starts[i + 1] : _buf.size();
        if (stop < starts[i]) {
            throw CodecError(
                ErrorKind::InvalidOffsets,
                layout.name + ": section '" + layout.sections[i].name
                    + "' starts after the section that follows it",
                starts[i]
            );
        }
    }
    for (std::size_t i = 0; i < layout.sections.size(); i++) {
        const std::size_t stop = i + 1 < starts.size() ? starts[i + 1] : _buf.size();
        out[layout.sections[i].name] = parse(layout.sections[i].shape, starts[i], stop);
    }
    return out;
}

nlohmann::ordered_json
StructuralParser::parse_fixed_rows(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop) {
    FM_LOG_INFO("Parsing %s...", shape.key.c_str());
    const std::size_t body = body_start(shape, anchor, nullptr);
    if (body > stop) {
        throw_codec_error(ErrorKind::TruncatedOrCorrupt, shape.key + ": body starts past stop", _buf, anchor);
    }
    TokenStream ts(_buf, body, stop);

    auto rows = nlohmann::ordered_json::array();
    for (std::size_t row = 0; row < shape.row_count; row++) {
        const std::string ctx = row_context(shape.key, row);
        bool resynced = false;
        auto obj = nlohmann::ordered_json::object();
        for (const auto& field : shape.fields) {
            const Token tok = expect(ts, field, ctx);
            if (field.kind == FieldKind::Int) {
                obj[field.name] = tok.int_value;
                FM_LOG_DEBUG("%s: %s@%s = %lld", ctx.c_str(), field.name.c_str(), hex_offset(tok.cursor).c_str(), static_cast<long long>(tok.int_value));
                continue;
            }
            std::string value = tok.str_value;
            if (shape.resync_trailing_control && !resynced) {
                if (const auto rp = detect_trailing_control(tok)) {
                    FM_LOG_DEBUG(
                        "%s: trimming stray 0x%02X and rewinding 1 byte to resynchronise", ctx.c_str(),
                        static_cast<unsigned>(static_cast<unsigned char>(value.back()))
                    );
                    value = rp->trimmed;
                    ts = TokenStream(_buf, rp->restart_at, stop);
                    resynced = true;
                    _report.resyncs++;
                }
            }
            FM_LOG_DEBUG("%s: %s@%s = \"%s\"", ctx.c_str(), field.name.c_str(), hex_offset(tok.cursor).c_str(), value.c_str());
            obj[field.name] = std::move(value);
        }
        rows.push_back(std::move(obj));
    }
    FM_LOG_INFO("finished %s - %zu rows", shape.key.c_str(), rows.size());
    return rows;
}

nlohmann::ordered_json
StructuralParser::parse_block_array(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop) {
    FM_LOG_INFO("Parsing %s... (start @%s, stop @%s)", shape.key.c_str(), hex_offset(anchor).c_str(), hex_offset(stop).c_str());
    std::optional<std::uint32_t> declared;
    const std::size_t body = body_start(shape, anchor, &declared);
    if (body > stop) {
        throw_codec_error(ErrorKind::TruncatedOrCorrupt, shape.key + ": body starts past stop", _buf, anchor);
    }
    const auto bounded = _buf.first(stop);
    const std::string& label_name = shape.fields.at(0).name;
    const std::string& value_name = shape.fields.at(1).name;

    auto blocks = nlohmann::ordered_json::array();
    auto current = nlohmann::ordered_json::array();
    std::size_t cur = body;
    while (cur < stop) {
        const std::size_t npos = find_bytes(bounded, shape.name_label, cur, stop);
        if (npos == std::string_view::npos) {
            break;
        }
        const std::size_t lstart = npos + shape.name_label.size();
        const std::size_t vpos = find_bytes(bounded, shape.value_label, lstart, stop);
        if (vpos == std::string_view::npos) {
            warn(shape.key + ": label at " + hex_offset(npos) + " has no value label before stop");
            FM_LOG_DEBUG("\n%s", hex_context(_buf, npos, 64).c_str());
            break;
        }
        const std::string label = clean_label(bounded.subspan(lstart, vpos - lstart));
        const DecodedInt d = decode_int(bounded, vpos + shape.value_label.size(), shape.int_rule);

        auto entry = nlohmann::ordered_json::object();
        entry[label_name] = label;
        entry[value_name] = d.value;
        current.push_back(std::move(entry));
        FM_LOG_DEBUG(
            "  block %02zu/coeff%02zu @%s: %-40s = %6lld  (%s)", blocks.size(), current.size() - 1,
            hex_offset(npos).c_str(), label.c_str(), static_cast<long long>(d.value),
            int_encoding_name(d.encoding)
        );

        if (current.size() == shape.block_size) {
            auto block = nlohmann::ordered_json::object();
            block[shape.block_field] = std::move(current);
            blocks.push_back(std::move(block));
            current = nlohmann::ordered_json::array();
        }
        cur = d.next;
    }

    if (!current.empty()) {
        _report.dropped_entries += current.size();
        warn(shape.key + ": trailing fragment with " + std::to_string(current.size()) + " entr"
             + (current.size() == 1 ? "y" : "ies") + " ignored");
    }
    if (declared.has_value() && *declared != blocks.size()) {
        warn(shape.key + ": array declares " + std::to_string(*declared) + " block(s), decoded "
             + std::to_string(blocks.size()));
    }
    FM_LOG_INFO("finished %s - %zu complete blocks", shape.key.c_str(), blocks.size());
    return blocks;
}

nlohmann::ordered_json
StructuralParser::parse_index_table(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop) {
    FM_LOG_INFO("Parsing %s...", shape.key.c_str());
    std::optional<std::uint32_t> declared;
    const std::size_t body = body_start(shape, anchor, &declared);
    if (body > stop) {
        throw_codec_error(ErrorKind::TruncatedOrCorrupt, shape.key + ": body starts past stop", _buf, anchor);
    }
    const auto bounded = _buf.first(stop);
    const std::string& index_name = shape.fields.at(0).name;
    const std::string& value_name = shape.fields.at(1).name;
    const std::string index_label = key_header_bytes(index_name);
    const std::string value_label = key_header_bytes(value_name);

    auto rows = nlohmann::ordered_json::array();
    std::size_t cur = body;
    while (!declared.has_value() || rows.size() < *declared) {
        const std::size_t idx_off = find_bytes(bounded, index_label, cur, stop);
        if (idx_off == std::string_view::npos) {
            break;
        }
        const DecodedInt index = decode_int(bounded, idx_off + index_label.size(), shape.int_rule);
        const std::size_t val_off = find_bytes(bounded, value_label, index.next, stop);
        if (val_off == std::string_view::npos) {
            throw_codec_error(
                ErrorKind::TruncatedOrCorrupt,
                shape.key + " row " + std::to_string(rows.size()) + ": '" + index_name
                    + "' without a following '" + value_name + "'",
                _buf, idx_off
            );
        }
        const DecodedInt value = decode_int(bounded, val_off + value_label.size(), shape.int_rule);

        auto row = nlohmann::ordered_json::object();
        row[index_name] = index.value;
        row[value_name] = value.value;
        rows.push_back(std::move(row));
        FM_LOG_DEBUG(
            "[%02zu]  %s=%-3lld  %s=%lld", rows.size() - 1, index_name.c_str(),
            static_cast<long long>(index.value), value_name.c_str(), static_cast<long long>(value.value)
        );
        cur = value.next;
    }

    if (declared.has_value() && rows.size() != *declared) {
        throw_codec_error(
            ErrorKind::TruncatedOrCorrupt,
            shape.key + ": expected " + std::to_string(*declared) + " rows, got "
                + std::to_string(rows.size()) + " (data truncated or malformed)",
            _buf, std::min(cur, _buf.size() - 1)
        );
    }
    FM_LOG_INFO("finished %s - %zu rows", shape.key.c_str(), rows.size());
    return rows;
}

nlohmann::ordered_json StructuralParser::parse_scalar(const ShapeDescriptor& shape, std::size_t anchor) {
    FM_LOG_INFO("Parsing %s", shape.key.c_str());
    expect_key_text(shape.key, anchor);
    const std::size_t pos = anchor + shape.key.size();
    ByteReader r(_buf, pos);
    const std::uint8_t vmark = r.peek_u8();
    if (vmark != marker::kInt32 && vmark != marker::kInt64) {
        throw_codec_error(
            ErrorKind::UnknownMarker, shape.key + ": unexpected value marker " + hex_byte(vmark), _buf,
            pos
        );
    }
    const DecodedInt d = decode_int(_buf, pos, IntRule::fixed());
    FM_LOG_INFO(
        "%s: found %lld at %s - %s", shape.key.c_str(), static_cast<long long>(d.value),
        hex_offset(pos + 1).c_str(), hex_offset(d.next - 1).c_str()
    );
    return d.value;
}

nlohmann::ordered_json
StructuralParser::parse_keyed_object(const ShapeDescriptor& shape, std::size_t anchor) {
    FM_LOG_INFO("Parsing %s data...", shape.key.c_str());
    expect_key_text(shape.key, anchor);
    ByteReader r(_buf, anchor + shape.key.size());
    const std::size_t marker_at = r.position();
    const std::uint8_t ctl = r.read_u8();
    if (std::find(shape.object_markers.begin(), shape.object_markers.end(), ctl)
        == shape.object_markers.end()) {
        throw_codec_error(
            ErrorKind::UnknownMarker,
            shape.key + ": expected object marker " + hex_byte(shape.object_markers.front()) + ", got "
                + hex_byte(ctl),
            _buf, marker_at
        );
    }

    auto out = nlohmann::ordered_json::object();
    for (const auto& field : shape.fields) {
        const std::size_t header_at = r.position();
        const std::uint8_t klen = r.read_u8();
        if (klen != field.name.size()) {
            throw_codec_error(
                ErrorKind::TokenMismatch,
                shape.key + ": unexpected key length " + std::to_string(klen) + " where '" + field.name
                    + "' (" + std::to_string(field.name.size()) + ") was expected",
                _buf, header_at
            );
        }
        const std::size_t text_at = r.position();
        const auto text = r.read_bytes(klen);
        if (!std::equal(text.begin(), text.end(), field.name.begin(), [](std::uint8_t a, char b) {
                return a == static_cast<std::uint8_t>(b);
            })) {
            throw_codec_error(
                ErrorKind::TokenMismatch,
                shape.key + ": got wrong key '" + lossy_utf8(text) + "' where '" + field.name
                    + "' was expected",
                _buf, text_at
            );
        }
        const DecodedInt d = decode_int(_buf, r.position(), shape.int_rule);
        out[field.name] = d.value;
        FM_LOG_DEBUG("%-16s = %lld", field.name.c_str(), static_cast<long long>(d.value));
        r.seek(d.next);
    }
    FM_LOG_INFO("finished %s", shape.key.c_str());
    return out;
}

}  // namespace fm::jsb
