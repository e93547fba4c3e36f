#pragma once

#include "core/document.h"
#include "io/io_error.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

// JSON schema for .rustiq documents.
//
// Decoding tries the current schema first, then each legacy schema in turn,
// migrating whatever matches forward. Legacy v1 files carry an integer
// `brush_size` instead of a `current_brush_style` object.
namespace rustique::document_codec
{
using json = nlohmann::json;

json ToJson(const Document& doc);
bool FromJson(const json& j, Document& out, IoError& err);

std::string Encode(const Document& doc);
bool        Decode(std::string_view text, Document& out, IoError& err);

// Checks shared by every schema version: at least one layer, every layer
// holds width*height cells, active index in range.
// Also enforces the persisted value ranges: eraser_size 0..kMaxCanvasDimension and
// a brush accepted by ValidateBrush().
bool Validate(const Document& doc, std::string& err);

// size > 0 and finite, hardness 0..1, angle -180..180, bristle_count <= kMaxFanBristles.
bool ValidateBrush(const BrushStyle& brush, std::string& err);
} // namespace rustique::document_codec
