// Structured failure report shared by the persistence layer.
#pragma once

#include <string>
#include <utility>

namespace rustique
{
enum class IoErrorKind : int
{
    None = 0,
    Io,                // open/read/write/rename failed
    Decode,            // bytes are not a valid document or image
    Encode,            // serialization or compression failed
    UnsupportedFormat, // recognised extension we cannot read or write
    UnknownExtension,  // extension not recognised at all
    NoSavePath,        // quick-save before the document was ever saved or opened
};

inline constexpr const char* IoErrorKindToString(IoErrorKind k)
{
    switch (k)
    {
        case IoErrorKind::None:              return "none";
        case IoErrorKind::Io:                return "io";
        case IoErrorKind::Decode:            return "decode";
        case IoErrorKind::Encode:            return "encode";
        case IoErrorKind::UnsupportedFormat: return "unsupported_format";
        case IoErrorKind::UnknownExtension:  return "unknown_extension";
        case IoErrorKind::NoSavePath:        return "no_save_path";
    }
    return "none";
}

struct IoError
{
    IoErrorKind kind = IoErrorKind::None;
    std::string message;

    bool Ok() const { return kind == IoErrorKind::None; }
    void Clear()
    {
        kind = IoErrorKind::None;
        message.clear();
    }
    void Set(IoErrorKind k, std::string msg)
    {
        kind = k;
        message = std::move(msg);
    }
};
} // namespace rustique
