#include "io/document_codec.h"

#include "core/canvas/canvas_internal.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace rustique::document_codec
{
namespace
{
static json ColourToJson(const Rgba8& c)
{
    return json::array({c.r, c.g, c.b, c.a});
}

static bool ColourFromJson(const json& v, Rgba8& out, const char* what, std::string& err)
{
    if (!v.is_array() || v.size() != 4)
    {
        err = std::string(what) + " is not an array of four channels.";
        return false;
    }
    std::uint8_t ch[4] = {};
    for (size_t i = 0; i < 4; ++i)
    {
        const json& c = v[i];
        if (!c.is_number_integer() && !c.is_number_unsigned())
        {
            err = std::string(what) + " contains a non-integer channel.";
            return false;
        }
        const std::int64_t n = c.get<std::int64_t>();
        if (n < 0 || n > 255)
        {
            err = std::string(what) + " channel is out of range 0..255.";
            return false;
        }
        ch[i] = (std::uint8_t)n;
    }
    out = Rgba8{ch[0], ch[1], ch[2], ch[3]};
    return true;
}

static bool NonNegativeInt(const json& j, const char* key, std::int64_t max_value, std::int64_t& out, std::string& err)
{
    if (!j.contains(key))
    {
        err = std::string("missing field '") + key + "'.";
        return false;
    }
    const json& v = j[key];
    if (!v.is_number_integer() && !v.is_number_unsigned())
    {
        err = std::string("field '") + key + "' is not an integer.";
        return false;
    }
    const std::int64_t n = v.is_number_unsigned() && v.get<std::uint64_t>() > (std::uint64_t)max_value
                               ? max_value + 1
                               : v.get<std::int64_t>();
    if (n < 0 || n > max_value)
    {
        err = std::string("field '") + key + "' is out of range.";
        return false;
    }
    out = n;
    return true;
}

static bool FloatField(const json& j, const char* key, float& out, std::string& err)
{
    if (!j.contains(key) || !j[key].is_number())
    {
        err = std::string("current_brush_style missing numeric '") + key + "'.";
        return false;
    }
    const double v = j[key].get<double>();
    if (!std::isfinite(v) || std::fabs(v) > (double)std::numeric_limits<float>::max())
    {
        err = std::string("current_brush_style.") + key + " is not a finite float.";
        return false;
    }
    out = (float)v;
    return true;
}

static json LayerToJson(const PixelLayer& layer)
{
    json data = json::array();
    for (const Cell& c : layer.cells)
        data.push_back(c ? ColourToJson(*c) : json(nullptr));

    json jl = json::object();
    jl["name"] = layer.name;
    jl["data"] = std::move(data);
    jl["visible"] = layer.visible;
    return jl;
}

static bool LayerFromJson(const json& jl, size_t index, PixelLayer& out, std::string& err)
{
    const std::string where = "layers[" + std::to_string(index) + "]";
    if (!jl.is_object())
    {
        err = where + " is not an object.";
        return false;
    }
    if (!jl.contains("name") || !jl["name"].is_string())
    {
        err = where + " missing 'name'.";
        return false;
    }
    if (!jl.contains("visible") || !jl["visible"].is_boolean())
    {
        err = where + " missing 'visible'.";
        return false;
    }
    if (!jl.contains("data") || !jl["data"].is_array())
    {
        err = where + " missing 'data' array.";
        return false;
    }

    out.name = jl["name"].get<std::string>();
    out.visible = jl["visible"].get<bool>();

    const json& data = jl["data"];
    out.cells.clear();
    out.cells.reserve(data.size());
    const std::string pixel_what = where + ".data";
    for (const json& px : data)
    {
        if (px.is_null())
        {
            out.cells.emplace_back(std::nullopt);
            continue;
        }
        Rgba8 c;
        if (!ColourFromJson(px, c, pixel_what.c_str(), err))
            return false;
        out.cells.emplace_back(c);
    }
    return true;
}

static json BrushToJson(const BrushStyle& b)
{
    json jb = json::object();
    jb["brush_type"] = BrushShapeToString(b.shape);
    jb["size"] = b.size;
    jb["angle"] = b.angle;
    jb["hardness"] = b.hardness;
    jb["bristle_count"] = b.bristle_count ? json(*b.bristle_count) : json(nullptr);
    jb["taper_strength"] = b.taper_strength ? json(*b.taper_strength) : json(nullptr);
    return jb;
}

static bool BrushFromJson(const json& jb, BrushStyle& out, std::string& err)
{
    if (!jb.is_object())
    {
        err = "current_brush_style is not an object.";
        return false;
    }
    if (!jb.contains("brush_type") || !jb["brush_type"].is_string())
    {
        err = "current_brush_style missing 'brush_type'.";
        return false;
    }
    BrushStyle b;
    const std::string type = jb["brush_type"].get<std::string>();
    if (!BrushShapeFromString(type, b.shape))
    {
        err = "unknown brush_type '" + type + "'.";
        return false;
    }
    if (!FloatField(jb, "size", b.size, err) || !FloatField(jb, "angle", b.angle, err) ||
        !FloatField(jb, "hardness", b.hardness, err))
        return false;

    b.bristle_count.reset();
    if (jb.contains("bristle_count") && !jb["bristle_count"].is_null())
    {
        if (!jb["bristle_count"].is_number_unsigned())
        {
            err = "current_brush_style.bristle_count is not an unsigned integer.";
            return false;
        }
        const std::uint64_t count = jb["bristle_count"].get<std::uint64_t>();
        if (count > kMaxFanBristles)
        {
            err = "current_brush_style.bristle_count exceeds " + std::to_string(kMaxFanBristles) + ".";
            return false;
        }
        b.bristle_count = (std::uint32_t)count;
    }
    b.taper_strength.reset();
    if (jb.contains("taper_strength") && !jb["taper_strength"].is_null())
    {
        float taper = 0.0f;
        if (!FloatField(jb, "taper_strength", taper, err))
            return false;
        b.taper_strength = taper;
    }
    out = b;
    return true;
}

// Fields present in every schema version.
static bool CommonFromJson(const json& j, Document& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "document is not a JSON object.";
        return false;
    }

    std::int64_t w = 0, h = 0, active = 0, eraser = 0;
    if (!NonNegativeInt(j, "width", kMaxCanvasDimension, w, err) ||
        !NonNegativeInt(j, "height", kMaxCanvasDimension, h, err) ||
        !NonNegativeInt(j, "active_layer_index", INT32_MAX, active, err))
        return false;

    if (!j.contains("eraser_size") || !j["eraser_size"].is_number_integer())
    {
        err = "missing integer field 'eraser_size'.";
        return false;
    }
    eraser = j["eraser_size"].get<std::int64_t>();
    if (eraser < INT32_MIN || eraser > INT32_MAX)
    {
        err = "field 'eraser_size' is out of range.";
        return false;
    }

    if (!j.contains("layers") || !j["layers"].is_array())
    {
        err = "missing 'layers' array.";
        return false;
    }
    std::vector<PixelLayer> layers;
    layers.reserve(j["layers"].size());
    for (size_t i = 0; i < j["layers"].size(); ++i)
    {
        PixelLayer layer;
        if (!LayerFromJson(j["layers"][i], i, layer, err))
            return false;
        layers.push_back(std::move(layer));
    }

    Rgba8 primary, secondary;
    if (!j.contains("primary_color") || !ColourFromJson(j["primary_color"], primary, "primary_color", err))
    {
        if (err.empty())
            err = "missing 'primary_color'.";
        return false;
    }
    if (!j.contains("secondary_color") || !ColourFromJson(j["secondary_color"], secondary, "secondary_color", err))
    {
        if (err.empty())
            err = "missing 'secondary_color'.";
        return false;
    }

    if (!j.contains("saved_colors") || !j["saved_colors"].is_array())
    {
        err = "missing 'saved_colors' array.";
        return false;
    }
    std::vector<Rgba8> saved;
    for (const json& c : j["saved_colors"])
    {
        Rgba8 rgba;
        if (!ColourFromJson(c, rgba, "saved_colors entry", err))
            return false;
        saved.push_back(rgba);
    }

    out.width = (int)w;
    out.height = (int)h;
    out.layers = std::move(layers);
    out.active_layer_index = (int)active;
    out.primary = primary;
    out.secondary = secondary;
    out.saved_colours = std::move(saved);
    out.eraser_size = (int)eraser;
    return true;
}

static bool CurrentFromJson(const json& j, Document& out, std::string& err)
{
    err.clear();
    Document doc;
    if (!CommonFromJson(j, doc, err))
        return false;
    if (!j.contains("current_brush_style"))
    {
        err = "missing 'current_brush_style'.";
        return false;
    }
    if (!BrushFromJson(j["current_brush_style"], doc.brush, err))
        return false;
    out = std::move(doc);
    return true;
}

// v1: `brush_size: int` instead of `current_brush_style`. Migrates to a Round brush.
static bool V1FromJson(const json& j, Document& out, std::string& err)
{
    err.clear();
    Document doc;
    if (!CommonFromJson(j, doc, err))
        return false;
    if (!j.contains("brush_size") || !j["brush_size"].is_number_integer())
    {
        err = "missing integer field 'brush_size'.";
        return false;
    }

    BrushStyle b;
    b.shape = BrushShape::Round;
    const std::int64_t size = j["brush_size"].get<std::int64_t>();
    if (size <= 0 || size > kMaxCanvasDimension)
    {
        err = "field 'brush_size' is out of range.";
        return false;
    }
    b.size = (float)size;
    b.angle = 0.0f;
    b.hardness = 1.0f;
    b.bristle_count.reset();
    b.taper_strength.reset();
    doc.brush = b;

    out = std::move(doc);
    return true;
}
} // namespace

bool ValidateBrush(const BrushStyle& b, std::string& err)
{
    if (!std::isfinite(b.size) || b.size <= 0.0f)
    {
        err = "brush size must be a positive finite number.";
        return false;
    }
    if (!(b.hardness >= 0.0f && b.hardness <= 1.0f))
    {
        err = "brush hardness must be within 0..1.";
        return false;
    }
    if (!(b.angle >= -180.0f && b.angle <= 180.0f))
    {
        err = "brush angle must be within -180..180 degrees.";
        return false;
    }
    if (b.bristle_count && *b.bristle_count > kMaxFanBristles)
    {
        err = "brush bristle_count exceeds " + std::to_string(kMaxFanBristles) + ".";
        return false;
    }
    if (b.taper_strength && !std::isfinite(*b.taper_strength))
    {
        err = "brush taper_strength must be finite.";
        return false;
    }
    return true;
}

json ToJson(const Document& doc)
{
    json layers = json::array();
    for (const PixelLayer& l : doc.layers)
        layers.push_back(LayerToJson(l));

    json saved = json::array();
    for (const Rgba8& c : doc.saved_colours)
        saved.push_back(ColourToJson(c));

    json j = json::object();
    j["width"] = doc.width;
    j["height"] = doc.height;
    j["layers"] = std::move(layers);
    j["active_layer_index"] = doc.active_layer_index;
    j["primary_color"] = ColourToJson(doc.primary);
    j["secondary_color"] = ColourToJson(doc.secondary);
    j["saved_colors"] = std::move(saved);
    j["current_brush_style"] = BrushToJson(doc.brush);
    j["eraser_size"] = doc.eraser_size;
    return j;
}

bool Validate(const Document& doc, std::string& err)
{
    err.clear();
    if (doc.width <= 0 || doc.height <= 0)
    {
        err = "canvas dimensions must be positive.";
        return false;
    }
    if (doc.layers.empty())
    {
        err = "document has no layers.";
        return false;
    }
    const size_t expected = (size_t)doc.width * (size_t)doc.height;
    for (size_t i = 0; i < doc.layers.size(); ++i)
    {
        if (doc.layers[i].cells.size() != expected)
        {
            err = "layers[" + std::to_string(i) + "] has " + std::to_string(doc.layers[i].cells.size()) +
                  " pixels, expected " + std::to_string(expected) + ".";
            return false;
        }
    }
    if (doc.active_layer_index < 0 || doc.active_layer_index >= (int)doc.layers.size())
    {
        err = "active_layer_index is out of range.";
        return false;
    }
    if (doc.eraser_size < 0 || doc.eraser_size > kMaxCanvasDimension)
    {
        err = "eraser_size is out of range.";
        return false;
    }
    return ValidateBrush(doc.brush, err);
}

bool FromJson(const json& j, Document& out, IoError& err)
{
    err.Clear();

    Document doc;
    std::string current_err;
    if (!CurrentFromJson(j, doc, current_err))
    {
        std::string legacy_err;
        if (!V1FromJson(j, doc, legacy_err))
        {
            err.Set(IoErrorKind::Decode,
                    "Not a recognised document (current schema: " + current_err + " v1 schema: " + legacy_err + ")");
            return false;
        }
    }

    std::string verr;
    if (!Validate(doc, verr))
    {
        err.Set(IoErrorKind::Decode, "Invalid document: " + verr);
        return false;
    }
    out = std::move(doc);
    return true;
}

std::string Encode(const Document& doc)
{
    return ToJson(doc).dump();
}

bool Decode(std::string_view text, Document& out, IoError& err)
{
    err.Clear();
    json j;
    try
    {
        j = json::parse(text.begin(), text.end());
    }
    catch (const json::parse_error& e)
    {
        err.Set(IoErrorKind::Decode, std::string("JSON parse failed: ") + e.what());
        return false;
    }
    return FromJson(j, out, err);
}
} // namespace rustique::document_codec
