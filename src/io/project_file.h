#pragma once

#include "core/document.h"
#include "io/io_error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace rustique::project_file
{
// Save/load Rustique project files (*.rustiq).
//
// Container: "RSQZ" magic, u32 LE version, u64 LE payload length, then the
// zstd-compressed JSON document. Plain JSON text (files written before the
// container existed) is accepted on load.
inline constexpr std::uint32_t kContainerVersion = 1;

bool PackDocument(const Document& doc, std::vector<std::uint8_t>& out, IoError& err);
bool UnpackDocument(const std::vector<std::uint8_t>& bytes, Document& out, IoError& err);

// Writes are atomic: the target is replaced only once the new bytes are on disk.
bool SaveDocumentToFile(const std::string& path, const Document& doc, IoError& err);
bool LoadDocumentFromFile(const std::string& path, Document& out, IoError& err);

// Raw file helpers shared with the settings store.
bool ReadAllBytes(const std::string& path, std::vector<std::uint8_t>& out, IoError& err);
bool WriteAllBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, IoError& err);
} // namespace rustique::project_file
