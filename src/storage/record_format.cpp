// File: src/storage/record_format.cpp
#include "storage/record_format.hpp"
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace patex {

namespace {

constexpr const char* kHexTag = "!hex";

// ============================================================================
// Emission helpers
// ============================================================================

// Length of the UTF-8 sequence at s[i], 0 if it is malformed
size_t DecodeUtf8(const std::string& s, size_t i, uint32_t& cp) {
    const auto byte = [&s](size_t k) { return static_cast<uint8_t>(s[k]); };
    const uint8_t lead = byte(i);

    size_t length;
    uint32_t min;
    if (lead < 0x80) { cp = lead; return 1; }
    else if ((lead & 0xE0) == 0xC0) { length = 2; cp = lead & 0x1F; min = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { length = 3; cp = lead & 0x0F; min = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { length = 4; cp = lead & 0x07; min = 0x10000; }
    else return 0;

    if (i + length > s.size()) {
        return 0;
    }
    for (size_t k = 1; k < length; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;  // Overlong, out of range or surrogate
    }
    return length;
}

bool IsValidUtf8(const std::string& s) {
    uint32_t cp;
    for (size_t i = 0; i < s.size();) {
        size_t length = DecodeUtf8(s, i, cp);
        if (length == 0) {
            return false;
        }
        i += length;
    }
    return true;
}

// Characters libyaml accepts verbatim inside a double-quoted scalar.
// Line breaks are excluded since quoted scalars fold them.
bool IsVerbatim(uint32_t cp) {
    return cp == 0x09 ||
           (cp >= 0x20 && cp <= 0x7E) ||
           (cp >= 0xA0 && cp <= 0xD7FF && cp != 0x2028 && cp != 0x2029) ||
           (cp >= 0xE000 && cp <= 0xFFFD && cp != 0xFEFF) ||
           (cp >= 0x10000 && cp <= 0x10FFFF);
}

// Double-quoted scalar with every other character escaped. Strings that are
// not UTF-8 are written as a "!hex" tagged scalar of their raw bytes.
std::string Quote(const std::string& value) {
    if (!IsValidUtf8(value)) {
        return "!hex \"" + ToHex(std::vector<uint8_t>(value.begin(), value.end())) + "\"";
    }

    std::string out = "\"";
    uint32_t cp;
    for (size_t i = 0; i < value.size();) {
        const size_t length = DecodeUtf8(value, i, cp);
        if (cp == '"') {
            out += "\\\"";
        } else if (cp == '\\') {
            out += "\\\\";
        } else if (IsVerbatim(cp)) {
            out.append(value, i, length);
        } else {
            char escape[16];
            if (cp <= 0xFF) {
                std::snprintf(escape, sizeof(escape), "\\x%02x", static_cast<unsigned>(cp));
            } else if (cp <= 0xFFFF) {
                std::snprintf(escape, sizeof(escape), "\\u%04x", static_cast<unsigned>(cp));
            } else {
                std::snprintf(escape, sizeof(escape), "\\U%08x", static_cast<unsigned>(cp));
            }
            out += escape;
        }
        i += length;
    }
    out += "\"";
    return out;
}

std::string FormatFloat(float value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<float>::max_digits10) << value;
    return oss.str();
}

std::string FormatDouble(double value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

std::string FormatIds(const std::vector<PatternID>& ids) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ids[i].value();
    }
    oss << "]";
    return oss.str();
}

// ============================================================================
// Parsing helpers
// ============================================================================

std::string ScalarOf(yaml_node_t* node) {
    if (node == nullptr || node->type != YAML_SCALAR_NODE) {
        return "";
    }
    return std::string(reinterpret_cast<char*>(node->data.scalar.value),
                       node->data.scalar.length);
}

// String field; "!hex" scalars carry raw bytes
std::string TextOf(yaml_node_t* node) {
    std::string text = ScalarOf(node);
    if (node != nullptr && node->tag != nullptr &&
        std::string(reinterpret_cast<char*>(node->tag)) == kHexTag) {
        std::vector<uint8_t> bytes = FromHex(text);
        return std::string(bytes.begin(), bytes.end());
    }
    return text;
}

template<typename Fn>
void ForEachPair(yaml_document_t* doc, yaml_node_t* node, Fn fn) {
    if (node == nullptr || node->type != YAML_MAPPING_NODE) {
        return;
    }
    for (yaml_node_pair_t* pair = node->data.mapping.pairs.start;
         pair < node->data.mapping.pairs.top; ++pair) {
        fn(ScalarOf(yaml_document_get_node(doc, pair->key)),
           yaml_document_get_node(doc, pair->value));
    }
}

template<typename Fn>
void ForEachItem(yaml_document_t* doc, yaml_node_t* node, Fn fn) {
    if (node == nullptr || node->type != YAML_SEQUENCE_NODE) {
        return;
    }
    for (yaml_node_item_t* item = node->data.sequence.items.start;
         item < node->data.sequence.items.top; ++item) {
        fn(yaml_document_get_node(doc, *item));
    }
}

std::vector<PatternID> ParseIds(yaml_document_t* doc, yaml_node_t* node) {
    std::vector<PatternID> ids;
    ForEachItem(doc, node, [&](yaml_node_t* item) {
        ids.emplace_back(std::stoull(ScalarOf(item)));
    });
    return ids;
}

uint8_t ParseSmall(const std::string& value) {
    unsigned long v = std::stoul(value);
    if (v > std::numeric_limits<uint8_t>::max()) {
        throw std::out_of_range("value exceeds u8: " + value);
    }
    return static_cast<uint8_t>(v);
}

} // anonymous namespace

// ============================================================================
// Hex
// ============================================================================

std::string ToHex(const std::vector<uint8_t>& bytes) {
    static const char* kDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex += kDigits[b >> 4];
        hex += kDigits[b & 0x0f];
    }
    return hex;
}

std::vector<uint8_t> FromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }

    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument(std::string("invalid hex digit: ") + c);
    };

    std::vector<uint8_t> bytes(hex.size() / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return bytes;
}

// ============================================================================
// Records
// ============================================================================

void WriteRecordYaml(std::ostream& out, const Pattern& p, int indent) {
    const std::string pad(static_cast<size_t>(indent), ' ');
    const auto& h = p.header;
    const auto& m = p.metadata.metrics;

    out << pad << "id: " << h.id.value() << "\n";
    out << pad << "version: " << h.version << "\n";
    out << pad << "type: " << ToString(h.type) << "\n";
    out << pad << "complexity: " << static_cast<int>(h.complexity) << "\n";
    out << pad << "confidence: " << static_cast<int>(h.confidence) << "\n";
    out << pad << "source_hash: " << h.source_hash << "\n";
    out << pad << "timestamp: " << h.timestamp.ToNanos() << "\n";
    out << pad << "expiration: " << h.expiration.ToNanos() << "\n";
    out << pad << "weight: " << FormatFloat(h.weight) << "\n";
    out << pad << "access_count: " << h.access_count << "\n";
    out << pad << "success_rate: " << FormatFloat(h.success_rate) << "\n";
    out << pad << "flags: " << h.flags << "\n";
    out << pad << "encoding: " << ToString(p.encoding) << "\n";
    out << pad << "payload: \"" << ToHex(p.payload) << "\"\n";

    out << pad << "tags: [";
    for (size_t i = 0; i < p.metadata.tags.size(); ++i) {
        if (i > 0) out << ", ";
        out << Quote(p.metadata.tags[i]);
    }
    out << "]\n";

    out << pad << "conditions: [";
    for (size_t i = 0; i < p.metadata.conditions.size(); ++i) {
        const auto& c = p.metadata.conditions[i];
        if (i > 0) out << ", ";
        out << "{field: " << Quote(c.field) << ", op: " << Quote(c.op)
            << ", value: " << Quote(c.value) << "}";
    }
    out << "]\n";

    out << pad << "constraints: [";
    for (size_t i = 0; i < p.metadata.constraints.size(); ++i) {
        const auto& c = p.metadata.constraints[i];
        if (i > 0) out << ", ";
        out << "{type: " << Quote(c.type) << ", limit: " << Quote(c.limit) << "}";
    }
    out << "]\n";

    out << pad << "metrics: {applications: " << m.applications
        << ", successes: " << m.successes
        << ", failures: " << m.failures
        << ", avg_improvement: " << FormatDouble(m.avg_improvement)
        << ", avg_latency_ms: " << FormatDouble(m.avg_latency_ms)
        << ", cost_savings: " << FormatDouble(m.cost_savings)
        << ", last_applied: " << m.last_applied.ToNanos() << "}\n";

    out << pad << "links: {dependencies: " << FormatIds(p.links.dependencies)
        << ", alternatives: " << FormatIds(p.links.alternatives)
        << ", contradicts: " << FormatIds(p.links.contradicts)
        << ", evolved_from: " << FormatIds(p.links.evolved_from) << "}\n";
}

std::string RecordToYaml(const Pattern& pattern) {
    std::ostringstream ss;
    WriteRecordYaml(ss, pattern, 0);
    return ss.str();
}

std::optional<Pattern> RecordFromNode(yaml_document_t* doc, yaml_node_t* node) {
    if (node == nullptr || node->type != YAML_MAPPING_NODE) {
        return std::nullopt;
    }

    Pattern p;
    bool has_id = false;

    try {
        ForEachPair(doc, node, [&](const std::string& key, yaml_node_t* value) {
            const std::string s = ScalarOf(value);
            auto& h = p.header;

            if (key == "id") { h.id = PatternID(std::stoull(s)); has_id = true; }
            else if (key == "version") h.version = static_cast<uint16_t>(std::stoul(s));
            else if (key == "type") h.type = ParsePatternType(s);
            else if (key == "complexity") h.complexity = ParseSmall(s);
            else if (key == "confidence") h.confidence = ParseSmall(s);
            else if (key == "source_hash") h.source_hash = static_cast<uint32_t>(std::stoul(s));
            else if (key == "timestamp") h.timestamp = Timestamp::FromNanos(std::stoull(s));
            else if (key == "expiration") h.expiration = Timestamp::FromNanos(std::stoull(s));
            else if (key == "weight") h.weight = std::stof(s);
            else if (key == "access_count") h.access_count = static_cast<uint32_t>(std::stoul(s));
            else if (key == "success_rate") h.success_rate = std::stof(s);
            else if (key == "flags") h.flags = static_cast<uint16_t>(std::stoul(s));
            else if (key == "encoding") p.encoding = ParseDataEncoding(s);
            else if (key == "payload") p.payload = FromHex(s);
            else if (key == "tags") {
                ForEachItem(doc, value, [&](yaml_node_t* item) {
                    p.metadata.tags.push_back(TextOf(item));
                });
            }
            else if (key == "conditions") {
                ForEachItem(doc, value, [&](yaml_node_t* item) {
                    Condition c;
                    ForEachPair(doc, item, [&](const std::string& k, yaml_node_t* v) {
                        if (k == "field") c.field = TextOf(v);
                        else if (k == "op") c.op = TextOf(v);
                        else if (k == "value") c.value = TextOf(v);
                    });
                    p.metadata.conditions.push_back(c);
                });
            }
            else if (key == "constraints") {
                ForEachItem(doc, value, [&](yaml_node_t* item) {
                    Constraint c;
                    ForEachPair(doc, item, [&](const std::string& k, yaml_node_t* v) {
                        if (k == "type") c.type = TextOf(v);
                        else if (k == "limit") c.limit = TextOf(v);
                    });
                    p.metadata.constraints.push_back(c);
                });
            }
            else if (key == "metrics") {
                auto& m = p.metadata.metrics;
                ForEachPair(doc, value, [&](const std::string& k, yaml_node_t* v) {
                    const std::string mv = ScalarOf(v);
                    if (k == "applications") m.applications = std::stoull(mv);
                    else if (k == "successes") m.successes = std::stoull(mv);
                    else if (k == "failures") m.failures = std::stoull(mv);
                    else if (k == "avg_improvement") m.avg_improvement = std::stod(mv);
                    else if (k == "avg_latency_ms") m.avg_latency_ms = std::stod(mv);
                    else if (k == "cost_savings") m.cost_savings = std::stod(mv);
                    else if (k == "last_applied") m.last_applied = Timestamp::FromNanos(std::stoull(mv));
                });
            }
            else if (key == "links") {
                ForEachPair(doc, value, [&](const std::string& k, yaml_node_t* v) {
                    if (k == "dependencies") p.links.dependencies = ParseIds(doc, v);
                    else if (k == "alternatives") p.links.alternatives = ParseIds(doc, v);
                    else if (k == "contradicts") p.links.contradicts = ParseIds(doc, v);
                    else if (k == "evolved_from") p.links.evolved_from = ParseIds(doc, v);
                });
            }
        });
    } catch (const std::logic_error& e) {
        std::cerr << "Malformed pattern record: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!has_id) {
        return std::nullopt;
    }
    return p;
}

std::optional<Pattern> RecordFromYaml(const std::string& text) {
    yaml_parser_t parser;
    yaml_document_t document;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(text.c_str()), text.size());

    if (!yaml_parser_load(&parser, &document)) {
        std::cerr << "YAML parse error in pattern record" << std::endl;
        yaml_parser_delete(&parser);
        return std::nullopt;
    }

    auto result = RecordFromNode(&document, yaml_document_get_root_node(&document));

    yaml_document_delete(&document);
    yaml_parser_delete(&parser);
    return result;
}

} // namespace patex
