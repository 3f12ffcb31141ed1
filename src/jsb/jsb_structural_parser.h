/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_shape.h"
#include "jsb/jsb_token_stream.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fm::jsb {

struct ParseReport {
    std::vector<std::string> warnings;
    std::size_t dropped_entries = 0;
    std::size_t resyncs = 0;
};

// Decodes records described by ShapeDescriptors. Every parse is all-or-nothing:
// a shape violation throws CodecError and nothing of that record is returned.
class StructuralParser {
   public:
    explicit StructuralParser(std::span<const std::uint8_t> buf) : _buf(buf) {}

    nlohmann::ordered_json parse(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop);
    nlohmann::ordered_json parse(const ShapeDescriptor& shape, std::size_t anchor) {
        return parse(shape, anchor, _buf.size());
    }

    // Sections are bounded by the next section's anchor, the last one by the
    // end of the buffer.
    nlohmann::ordered_json parse_layout(const RecordLayout& layout, const SectionAnchors& anchors);

    const ParseReport& report() const { return _report; }

   private:
    void expect_key_text(const std::string& key, std::size_t anchor) const;
    std::size_t
    body_start(const ShapeDescriptor& shape, std::size_t anchor, std::optional<std::uint32_t>* declared)
        const;
    Token expect(TokenStream& ts, const FieldSpec& field, const std::string& ctx) const;

    nlohmann::ordered_json parse_fixed_rows(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop);
    nlohmann::ordered_json parse_block_array(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop);
    nlohmann::ordered_json parse_index_table(const ShapeDescriptor& shape, std::size_t anchor, std::size_t stop);
    nlohmann::ordered_json parse_scalar(const ShapeDescriptor& shape, std::size_t anchor);
    nlohmann::ordered_json parse_keyed_object(const ShapeDescriptor& shape, std::size_t anchor);

    void warn(std::string message);

    std::span<const std::uint8_t> _buf;
    ParseReport _report;
};

}  // namespace fm::jsb
