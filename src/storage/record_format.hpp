// File: src/storage/record_format.hpp
//
// Textual pattern record used by the durable tier.
//
// A record is a YAML mapping with one scalar per header field, the payload
// as a hex string and the body lists in flow style. Both cold-store backends
// share it: the file store nests records under a top-level "patterns" map,
// the SQLite store keeps one standalone record per row.

#pragma once

#include "core/pattern.hpp"
#include <yaml.h>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace patex {

/// Emit a pattern as a block mapping, every line prefixed by indent spaces
void WriteRecordYaml(std::ostream& out, const Pattern& pattern, int indent);

/// Standalone record document
std::string RecordToYaml(const Pattern& pattern);

/// Parse a standalone record document
/// @return std::nullopt if the text is not a well-formed record
std::optional<Pattern> RecordFromYaml(const std::string& text);

/// Parse a record mapping node inside an already loaded document
std::optional<Pattern> RecordFromNode(yaml_document_t* document, yaml_node_t* node);

std::string ToHex(const std::vector<uint8_t>& bytes);

/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> FromHex(const std::string& hex);

} // namespace patex
