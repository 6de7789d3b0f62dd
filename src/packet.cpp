#include "protocol/packet.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <limits>

namespace protocol {

bool is_known_opcode(uint8_t value) {
    return value == static_cast<uint8_t>(OpCode::DOWNLOAD) ||
           value == static_cast<uint8_t>(OpCode::UPLOAD);
}

void check_name_length(uint32_t length, uint32_t max_name_length) {
    if (length == 0) {
        throw FramingError("Empty filename in frame");
    }
    if (length > max_name_length) {
        throw FramingError("Filename length " + std::to_string(length) +
                           " exceeds limit of " + std::to_string(max_name_length));
    }
}

void check_header_prefix(const HeaderPrefix& prefix, uint32_t max_name_length) {
    check_name_length(prefix.name_length, max_name_length);
    if (prefix.file_size < 0) {
        throw FramingError("Negative file size in header: " + std::to_string(prefix.file_size));
    }
}

std::array<uint8_t, NAME_LENGTH_SIZE> encode_name_length(uint32_t length) {
    std::array<uint8_t, NAME_LENGTH_SIZE> buffer;
    uint32_t len = boost::endian::native_to_little(length);
    std::memcpy(buffer.data(), &len, 4);
    return buffer;
}

uint32_t decode_name_length(const std::array<uint8_t, NAME_LENGTH_SIZE>& buffer) {
    uint32_t len;
    std::memcpy(&len, buffer.data(), 4);
    return boost::endian::little_to_native(len);
}

std::vector<uint8_t> serialize_header(const TransferHeader& header) {
    if (header.filename.size() > std::numeric_limits<uint32_t>::max()) {
        throw FramingError("Filename too long to frame");
    }

    std::vector<uint8_t> buffer(HEADER_FIXED_SIZE + header.filename.size());
    uint32_t name_len = boost::endian::native_to_little(static_cast<uint32_t>(header.filename.size()));
    int64_t size = boost::endian::native_to_little(header.file_size);

    std::memcpy(buffer.data(), &name_len, 4);
    std::memcpy(buffer.data() + 4, &size, 8);
    std::memcpy(buffer.data() + 12, header.checksum.data(), CHECKSUM_SIZE);
    std::memcpy(buffer.data() + HEADER_FIXED_SIZE, header.filename.data(), header.filename.size());

    return buffer;
}

HeaderPrefix deserialize_header_prefix(const std::array<uint8_t, HEADER_FIXED_SIZE>& buffer) {
    HeaderPrefix prefix;
    uint32_t name_len;
    int64_t size;

    std::memcpy(&name_len, buffer.data(), 4);
    std::memcpy(&size, buffer.data() + 4, 8);
    std::memcpy(prefix.checksum.data(), buffer.data() + 12, CHECKSUM_SIZE);

    prefix.name_length = boost::endian::little_to_native(name_len);
    prefix.file_size = boost::endian::little_to_native(size);
    return prefix;
}

std::vector<uint8_t> serialize_request(const std::string& filename) {
    if (filename.size() > std::numeric_limits<uint32_t>::max()) {
        throw FramingError("Filename too long to frame");
    }

    auto len = encode_name_length(static_cast<uint32_t>(filename.size()));
    std::vector<uint8_t> buffer(len.begin(), len.end());
    buffer.insert(buffer.end(), filename.begin(), filename.end());
    return buffer;
}

TransferHeader parse_header(const std::vector<uint8_t>& buffer, uint32_t max_name_length) {
    if (buffer.size() < HEADER_FIXED_SIZE) {
        throw FramingError("Short header: " + std::to_string(buffer.size()) + " bytes");
    }

    std::array<uint8_t, HEADER_FIXED_SIZE> fixed;
    std::memcpy(fixed.data(), buffer.data(), HEADER_FIXED_SIZE);
    HeaderPrefix prefix = deserialize_header_prefix(fixed);

    check_header_prefix(prefix, max_name_length);
    if (buffer.size() - HEADER_FIXED_SIZE < prefix.name_length) {
        throw FramingError("Short header: filename truncated");
    }

    TransferHeader header;
    header.file_size = prefix.file_size;
    header.checksum = prefix.checksum;
    header.filename.assign(reinterpret_cast<const char*>(buffer.data()) + HEADER_FIXED_SIZE,
                           prefix.name_length);
    return header;
}

} // namespace protocol
