#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <stdexcept>
#include "protocol/checksum.hpp"

namespace protocol {

// First byte on every connection, selects the server-side handler.
enum class OpCode : uint8_t {
    DOWNLOAD = 1,
    UPLOAD = 2
};

bool is_known_opcode(uint8_t value);

class FramingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Metadata preceding the raw file bytes, sent by the uploader and by the
// server in answer to a download request.
struct TransferHeader {
    std::string filename;
    int64_t file_size = 0;
    Checksum checksum{};
};

// name length (u32) + file size (i64) + checksum, all little-endian.
// The filename bytes follow the fixed part on the wire.
constexpr std::size_t HEADER_FIXED_SIZE = 4 + 8 + CHECKSUM_SIZE;
constexpr std::size_t NAME_LENGTH_SIZE = 4;

struct HeaderPrefix {
    uint32_t name_length;
    int64_t file_size;
    Checksum checksum;
};

std::vector<uint8_t> serialize_header(const TransferHeader& header);
HeaderPrefix deserialize_header_prefix(const std::array<uint8_t, HEADER_FIXED_SIZE>& buffer);

// Download request: the bare length-prefixed filename.
std::vector<uint8_t> serialize_request(const std::string& filename);

std::array<uint8_t, NAME_LENGTH_SIZE> encode_name_length(uint32_t length);
uint32_t decode_name_length(const std::array<uint8_t, NAME_LENGTH_SIZE>& buffer);

// Full header parse from a contiguous buffer; throws FramingError on short
// input, negative sizes or a name longer than max_name_length.
TransferHeader parse_header(const std::vector<uint8_t>& buffer, uint32_t max_name_length);

// Reject declared lengths the receiver is not willing to allocate.
void check_name_length(uint32_t length, uint32_t max_name_length);

// Name length bound plus a non-negative file size. Shared by the buffer
// parser and the stream reader.
void check_header_prefix(const HeaderPrefix& prefix, uint32_t max_name_length);

} // namespace protocol
