#pragma once

#include <string>
#include <functional>
#include <istream>
#include <ostream>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "protocol/packet.hpp"
#include "protocol/checksum.hpp"

namespace transfer {

using TlsStream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

enum class TransferState {
    COMPLETED,
    CHECKSUM_MISMATCH,
    FAILED
};

const char* to_string(TransferState state);

struct TransferResult {
    TransferState state = TransferState::FAILED;
    std::string path;
    uint64_t bytes = 0;
    protocol::Checksum checksum{};
    std::string error;

    bool ok() const { return state == TransferState::COMPLETED; }
};

// Every method throws protocol::FramingError when the peer goes away or a
// write fails part way; the caller abandons the connection.
class MessageSender {
public:
    static void send_opcode(TlsStream& stream, protocol::OpCode op);
    static void send_request(TlsStream& stream, const std::string& filename);
    static void send_header(TlsStream& stream, const protocol::TransferHeader& header);
    static void send_header(TlsStream& stream, const std::string& filename, int64_t file_size,
                            const protocol::Checksum& checksum);

    // Streams `in` to end of file, returns the number of bytes written.
    static uint64_t send_file(TlsStream& stream, std::istream& in, const std::string& filename,
                              uint64_t total_size, std::size_t buffer_size,
                              TransferProgressCallback progress_cb = nullptr);
};

class MessageReceiver {
public:
    static uint8_t receive_opcode(TlsStream& stream);
    static std::string receive_request(TlsStream& stream, uint32_t max_name_length);
    static protocol::TransferHeader receive_header(TlsStream& stream, uint32_t max_name_length);

    // Copies exactly `size` bytes into `out`, hashing them on the way.
    static uint64_t receive_exact(TlsStream& stream, std::ostream& out, uint64_t size,
                                  protocol::Hasher& hasher, const std::string& filename,
                                  std::size_t buffer_size,
                                  TransferProgressCallback progress_cb = nullptr);

    // Copies until the peer closes the connection. The declared size is only
    // used for progress reporting.
    static uint64_t receive_until_close(TlsStream& stream, std::ostream& out,
                                        const std::string& filename, uint64_t expected_size,
                                        std::size_t buffer_size,
                                        TransferProgressCallback progress_cb = nullptr);
};

// TLS close_notify followed by socket close; errors are irrelevant once the
// session is over.
void close_stream(TlsStream& stream);

} // namespace transfer
