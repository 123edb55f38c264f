/**
 * @file document_log_format.h
 * @brief Binary layout of the document journal (.journal)
 *
 * Every journal file starts with an 8-byte fixed header:
 *   - 4 bytes: Magic number "SEMJ"
 *   - 4 bytes: Format version (uint32_t, native byte order)
 *
 * The header is followed by zero or more records:
 *   - 1 byte:  Operation (RecordOp)
 *   - 4 bytes: Key length (uint32_t) followed by key bytes
 *   - 4 bytes: Document length (uint32_t) followed by document bytes (JSON text, empty for deletes)
 *   - 4 bytes: CRC32 (zlib) of every preceding byte of the record
 *
 * A record that is cut short or fails its CRC ends replay; the file is
 * truncated back to the last good record.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace semcache::storage::journal_format {

// Magic number for journal files ("SEMJ" in ASCII)
constexpr std::array<char, 4> kMagicNumber = {'S', 'E', 'M', 'J'};

// Current format version
constexpr uint32_t kCurrentVersion = 1;

// Fixed file header size (magic + version)
constexpr size_t kFixedHeaderSize = 8;

// File name suffix appended to the collection name
constexpr const char* kFileExtension = ".journal";

// Upper bounds used to reject garbage lengths during replay
constexpr uint32_t kMaxKeyLength = 64 * 1024;
constexpr uint32_t kMaxDocumentLength = 64 * 1024 * 1024;

/**
 * @brief Record operation
 */
enum class RecordOp : std::uint8_t {
  kPut = 1,
  kDelete = 2,
};

}  // namespace semcache::storage::journal_format
