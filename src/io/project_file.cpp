#include "io/project_file.h"

#include "io/document_codec.h"

#include <zstd.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>

namespace rustique::project_file
{
namespace
{
namespace fs = std::filesystem;

static constexpr unsigned char kMagic[4] = {'R', 'S', 'Q', 'Z'};
static constexpr size_t kHeaderSize = 4 + 4 + 8;
static constexpr int kZstdLevel = 3;
static constexpr std::uint64_t kMaxPayloadBytes = 1ull << 32;

static void PutLE(std::vector<std::uint8_t>& out, std::uint64_t v, int bytes)
{
    for (int i = 0; i < bytes; ++i)
        out.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

static std::uint64_t GetLE(const std::vector<std::uint8_t>& in, size_t off, int bytes)
{
    std::uint64_t v = 0;
    for (int i = 0; i < bytes; ++i)
        v |= ((std::uint64_t)in[off + (size_t)i]) << (8 * i);
    return v;
}

static bool HasMagic(const std::vector<std::uint8_t>& bytes)
{
    return bytes.size() >= 4 && bytes[0] == kMagic[0] && bytes[1] == kMagic[1] && bytes[2] == kMagic[2] &&
           bytes[3] == kMagic[3];
}

static bool Compress(std::string_view in, std::vector<std::uint8_t>& out, IoError& err)
{
    out.resize(ZSTD_compressBound(in.size()));
    const size_t n = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), kZstdLevel);
    if (ZSTD_isError(n))
    {
        err.Set(IoErrorKind::Encode, std::string("zstd compress failed: ") + ZSTD_getErrorName(n));
        out.clear();
        return false;
    }
    out.resize(n);
    return true;
}

// Frames without a recorded content size are streamed so the allocation follows
// the bytes actually produced instead of the header's claim.
static bool DecompressStreaming(const std::uint8_t* in, size_t in_size, size_t expected, std::string& out,
                                IoError& err)
{
    ZSTD_DCtx* dctx = ZSTD_createDCtx();
    if (!dctx)
    {
        err.Set(IoErrorKind::Decode, "zstd decompress failed: out of memory.");
        return false;
    }

    std::string chunk(ZSTD_DStreamOutSize(), '\0');
    ZSTD_inBuffer src{in, in_size, 0};
    size_t ret = 1;
    bool ok = true;
    while (ok && ret != 0)
    {
        ZSTD_outBuffer dst{chunk.data(), chunk.size(), 0};
        ret = ZSTD_decompressStream(dctx, &dst, &src);
        if (ZSTD_isError(ret))
        {
            err.Set(IoErrorKind::Decode, std::string("zstd decompress failed: ") + ZSTD_getErrorName(ret));
            ok = false;
        }
        else if (dst.pos > expected - out.size())
        {
            err.Set(IoErrorKind::Decode, "zstd decompress failed: payload longer than the header length.");
            ok = false;
        }
        else
        {
            out.append(chunk.data(), dst.pos);
            if (ret != 0 && src.pos == src.size && dst.pos < dst.size)
            {
                err.Set(IoErrorKind::Decode, "zstd decompress failed: truncated frame.");
                ok = false;
            }
        }
    }
    ZSTD_freeDCtx(dctx);
    if (!ok)
        return false;
    if (out.size() != expected)
    {
        err.Set(IoErrorKind::Decode, "zstd decompress failed: size mismatch.");
        return false;
    }
    return true;
}

static bool Decompress(const std::uint8_t* in, size_t in_size, std::uint64_t expected, std::string& out, IoError& err)
{
    if (expected > kMaxPayloadBytes || expected > (std::uint64_t)std::numeric_limits<size_t>::max())
    {
        err.Set(IoErrorKind::Decode, "zstd decompress failed: header length " + std::to_string(expected) +
                                         " exceeds the payload limit.");
        return false;
    }
    // Refuse lengths the frame itself contradicts before allocating.
    const unsigned long long frame_size = ZSTD_getFrameContentSize(in, in_size);
    if (frame_size == ZSTD_CONTENTSIZE_ERROR)
    {
        err.Set(IoErrorKind::Decode, "zstd decompress failed: not a zstd frame.");
        return false;
    }
    if (frame_size != ZSTD_CONTENTSIZE_UNKNOWN && frame_size != expected)
    {
        err.Set(IoErrorKind::Decode, "zstd decompress failed: header length does not match the frame.");
        return false;
    }

    try
    {
        out.clear();
        if (frame_size == ZSTD_CONTENTSIZE_UNKNOWN)
        {
            if (!DecompressStreaming(in, in_size, (size_t)expected, out, err))
            {
                out.clear();
                return false;
            }
            return true;
        }

        out.resize((size_t)expected);
        const size_t n = ZSTD_decompress(out.data(), out.size(), in, in_size);
        if (ZSTD_isError(n))
        {
            err.Set(IoErrorKind::Decode, std::string("zstd decompress failed: ") + ZSTD_getErrorName(n));
            out.clear();
            return false;
        }
        if (n != out.size())
        {
            err.Set(IoErrorKind::Decode, "zstd decompress failed: size mismatch.");
            out.clear();
            return false;
        }
    }
    catch (const std::exception& e)
    {
        err.Set(IoErrorKind::Decode, std::string("zstd decompress failed: ") + e.what());
        out.clear();
        return false;
    }
    return true;
}
} // namespace

bool PackDocument(const Document& doc, std::vector<std::uint8_t>& out, IoError& err)
{
    err.Clear();
    out.clear();

    const std::string text = document_codec::Encode(doc);
    std::vector<std::uint8_t> compressed;
    if (!Compress(text, compressed, err))
        return false;

    out.reserve(kHeaderSize + compressed.size());
    out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
    PutLE(out, kContainerVersion, 4);
    PutLE(out, (std::uint64_t)text.size(), 8);
    out.insert(out.end(), compressed.begin(), compressed.end());
    return true;
}

bool UnpackDocument(const std::vector<std::uint8_t>& bytes, Document& out, IoError& err)
{
    err.Clear();
    if (!HasMagic(bytes))
    {
        // Uncompressed JSON from earlier releases.
        const std::string_view text((const char*)bytes.data(), bytes.size());
        return document_codec::Decode(text, out, err);
    }

    if (bytes.size() < kHeaderSize)
    {
        err.Set(IoErrorKind::Decode, "Invalid project header (truncated).");
        return false;
    }
    const std::uint32_t version = (std::uint32_t)GetLE(bytes, 4, 4);
    if (version != kContainerVersion)
    {
        err.Set(IoErrorKind::Decode, "Unsupported project version " + std::to_string(version) + ".");
        return false;
    }
    const std::uint64_t text_len = GetLE(bytes, 8, 8);

    std::string text;
    if (!Decompress(bytes.data() + kHeaderSize, bytes.size() - kHeaderSize, text_len, text, err))
        return false;
    return document_codec::Decode(text, out, err);
}

bool ReadAllBytes(const std::string& path, std::vector<std::uint8_t>& out, IoError& err)
{
    err.Clear();
    out.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err.Set(IoErrorKind::Io, "Failed to open '" + path + "' for reading.");
        return false;
    }
    in.seekg(0, std::ios::end);
    const std::streamoff sz = in.tellg();
    if (sz < 0)
    {
        err.Set(IoErrorKind::Io, "Failed to read size of '" + path + "'.");
        return false;
    }
    in.seekg(0, std::ios::beg);
    out.resize((size_t)sz);
    if (sz > 0)
        in.read(reinterpret_cast<char*>(out.data()), sz);
    if (!in && sz > 0)
    {
        err.Set(IoErrorKind::Io, "Failed to read '" + path + "'.");
        out.clear();
        return false;
    }
    return true;
}

bool WriteAllBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, IoError& err)
{
    err.Clear();
    std::error_code ec;
    const fs::path p(path);
    if (p.has_parent_path())
    {
        fs::create_directories(p.parent_path(), ec);
        if (ec)
        {
            err.Set(IoErrorKind::Io, "Failed to create '" + p.parent_path().string() + "': " + ec.message());
            return false;
        }
    }

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            err.Set(IoErrorKind::Io, "Failed to open '" + tmp + "' for writing.");
            return false;
        }
        if (!bytes.empty())
            out.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
        out.close();
        if (!out)
        {
            err.Set(IoErrorKind::Io, "Failed to write '" + tmp + "'.");
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
        err.Set(IoErrorKind::Io, "Failed to replace '" + path + "': " + ec.message());
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }
    return true;
}

bool SaveDocumentToFile(const std::string& path, const Document& doc, IoError& err)
{
    std::vector<std::uint8_t> bytes;
    if (!PackDocument(doc, bytes, err))
        return false;
    return WriteAllBytesAtomic(path, bytes, err);
}

bool LoadDocumentFromFile(const std::string& path, Document& out, IoError& err)
{
    std::vector<std::uint8_t> bytes;
    if (!ReadAllBytes(path, bytes, err))
        return false;
    return UnpackDocument(bytes, out, err);
}
} // namespace rustique::project_file
