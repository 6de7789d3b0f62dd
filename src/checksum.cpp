#include "protocol/checksum.hpp"
#include <fstream>
#include <vector>

namespace protocol {

Hasher::Hasher() {
    if (sodium_init() < 0) {
        throw ChecksumError("libsodium initialization failed");
    }
    crypto_hash_sha256_init(&state_);
}

void Hasher::update(const void* data, std::size_t size) {
    crypto_hash_sha256_update(&state_, static_cast<const unsigned char*>(data), size);
}

Checksum Hasher::finish() {
    Checksum digest{};
    crypto_hash_sha256_final(&state_, digest.data());
    return digest;
}

Checksum compute_checksum(std::istream& in) {
    Hasher hasher;
    std::vector<char> buffer(64 * 1024);

    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad() || !in.eof()) {
        throw ChecksumError("Read error while computing checksum");
    }
    return hasher.finish();
}

Checksum compute_checksum(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw ChecksumError("Could not open file for hashing: " + filepath);
    }
    return compute_checksum(file);
}

std::string to_hex(const Checksum& checksum) {
    char hex[CHECKSUM_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), checksum.data(), checksum.size());
    return std::string(hex);
}

} // namespace protocol
