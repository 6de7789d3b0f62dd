#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <sodium.h>

namespace protocol {

constexpr std::size_t CHECKSUM_SIZE = crypto_hash_sha256_BYTES; // 32 bytes

using Checksum = std::array<uint8_t, CHECKSUM_SIZE>;

class ChecksumError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Incremental SHA-256 over libsodium, for hashing bytes as they stream past.
class Hasher {
public:
    Hasher();
    void update(const void* data, std::size_t size);
    Checksum finish();

private:
    crypto_hash_sha256_state state_;
};

// Hash every byte of the stream/file. Throws ChecksumError when the source
// cannot be opened or a read fails before end of file.
Checksum compute_checksum(std::istream& in);
Checksum compute_checksum(const std::string& filepath);

std::string to_hex(const Checksum& checksum);

} // namespace protocol
