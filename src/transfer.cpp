#include "transfer.hpp"
#include <vector>
#include <chrono>
#include <algorithm>
#include <array>
#include <stdexcept>

namespace transfer {

namespace {

// Throttles progress callbacks to one every 300ms plus the final one.
class ProgressTracker {
public:
    ProgressTracker(const std::string& filename, uint64_t total, TransferProgressCallback cb)
        : filename_(filename), total_(total), cb_(std::move(cb)),
          start_time_(std::chrono::steady_clock::now()), last_cb_time_(start_time_) {}

    void update(uint64_t done, bool force = false) {
        if (!cb_) return;
        auto now = std::chrono::steady_clock::now();
        auto since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time_).count();
        if (since_cb < 300 && !force && done != total_) return;

        double elapsed = std::chrono::duration<double>(now - start_time_).count();
        double speed = (elapsed > 0) ? (done / elapsed / (1024.0 * 1024.0)) : 0;
        cb_(filename_, done, total_, speed);
        last_cb_time_ = now;
    }

private:
    std::string filename_;
    uint64_t total_;
    TransferProgressCallback cb_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_cb_time_;
};

void write_all(TlsStream& stream, const void* data, std::size_t size, const char* what) {
    boost::system::error_code ec;
    std::size_t written = boost::asio::write(stream, boost::asio::buffer(data, size), ec);
    if (ec || written != size) {
        throw protocol::FramingError(std::string("Failed to write ") + what + ": " +
                                     (ec ? ec.message() : "short write"));
    }
}

void read_all(TlsStream& stream, void* data, std::size_t size, const char* what) {
    boost::system::error_code ec;
    std::size_t got = boost::asio::read(stream, boost::asio::buffer(data, size), ec);
    if (ec || got != size) {
        throw protocol::FramingError(std::string("Failed to read ") + what + ": " +
                                     (ec ? ec.message() : "short read"));
    }
}

bool is_end_of_stream(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated;
}

} // namespace

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::COMPLETED: return "completed";
        case TransferState::CHECKSUM_MISMATCH: return "checksum mismatch";
        case TransferState::FAILED: return "failed";
    }
    return "unknown";
}

// ─── MessageSender ──────────────────────────────────────────────────────────

void MessageSender::send_opcode(TlsStream& stream, protocol::OpCode op) {
    uint8_t code = static_cast<uint8_t>(op);
    write_all(stream, &code, 1, "operation code");
}

void MessageSender::send_request(TlsStream& stream, const std::string& filename) {
    auto buf = protocol::serialize_request(filename);
    write_all(stream, buf.data(), buf.size(), "download request");
}

void MessageSender::send_header(TlsStream& stream, const protocol::TransferHeader& header) {
    auto buf = protocol::serialize_header(header);
    write_all(stream, buf.data(), buf.size(), "file header");
}

void MessageSender::send_header(TlsStream& stream, const std::string& filename, int64_t file_size,
                                const protocol::Checksum& checksum) {
    send_header(stream, protocol::TransferHeader{filename, file_size, checksum});
}

uint64_t MessageSender::send_file(TlsStream& stream, std::istream& in, const std::string& filename,
                                  uint64_t total_size, std::size_t buffer_size,
                                  TransferProgressCallback progress_cb) {
    ProgressTracker progress(filename, total_size, std::move(progress_cb));
    std::vector<char> buffer(buffer_size);
    uint64_t total_sent = 0;

    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
        std::streamsize bytes_read = in.gcount();
        write_all(stream, buffer.data(), static_cast<std::size_t>(bytes_read), "file data");
        total_sent += static_cast<uint64_t>(bytes_read);
        progress.update(total_sent);
    }
    if (in.bad()) {
        throw std::runtime_error("Read error on local file " + filename);
    }
    progress.update(total_sent, true);
    return total_sent;
}

// ─── MessageReceiver ────────────────────────────────────────────────────────

uint8_t MessageReceiver::receive_opcode(TlsStream& stream) {
    uint8_t code = 0;
    read_all(stream, &code, 1, "operation code");
    return code;
}

std::string MessageReceiver::receive_request(TlsStream& stream, uint32_t max_name_length) {
    std::array<uint8_t, protocol::NAME_LENGTH_SIZE> len_buf;
    read_all(stream, len_buf.data(), len_buf.size(), "filename length");
    uint32_t name_len = protocol::decode_name_length(len_buf);
    protocol::check_name_length(name_len, max_name_length);

    std::string filename(name_len, '\0');
    read_all(stream, &filename[0], name_len, "filename");
    return filename;
}

protocol::TransferHeader MessageReceiver::receive_header(TlsStream& stream, uint32_t max_name_length) {
    std::array<uint8_t, protocol::HEADER_FIXED_SIZE> fixed;
    read_all(stream, fixed.data(), fixed.size(), "file header");
    protocol::HeaderPrefix prefix = protocol::deserialize_header_prefix(fixed);

    protocol::check_header_prefix(prefix, max_name_length);

    protocol::TransferHeader header;
    header.file_size = prefix.file_size;
    header.checksum = prefix.checksum;
    header.filename.resize(prefix.name_length);
    read_all(stream, &header.filename[0], prefix.name_length, "filename");
    return header;
}

uint64_t MessageReceiver::receive_exact(TlsStream& stream, std::ostream& out, uint64_t size,
                                        protocol::Hasher& hasher, const std::string& filename,
                                        std::size_t buffer_size,
                                        TransferProgressCallback progress_cb) {
    ProgressTracker progress(filename, size, std::move(progress_cb));
    std::vector<char> buffer(buffer_size);
    uint64_t total_received = 0;

    while (total_received < size) {
        std::size_t want = static_cast<std::size_t>(
            std::min<uint64_t>(buffer.size(), size - total_received));
        boost::system::error_code ec;
        std::size_t n = stream.read_some(boost::asio::buffer(buffer.data(), want), ec);
        if (ec) {
            throw protocol::FramingError("Connection lost after " + std::to_string(total_received) +
                                         " of " + std::to_string(size) + " bytes: " + ec.message());
        }

        out.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!out) {
            throw std::runtime_error("Write error on local file " + filename);
        }
        hasher.update(buffer.data(), n);
        total_received += n;
        progress.update(total_received);
    }
    return total_received;
}

uint64_t MessageReceiver::receive_until_close(TlsStream& stream, std::ostream& out,
                                              const std::string& filename, uint64_t expected_size,
                                              std::size_t buffer_size,
                                              TransferProgressCallback progress_cb) {
    ProgressTracker progress(filename, expected_size, std::move(progress_cb));
    std::vector<char> buffer(buffer_size);
    uint64_t total_received = 0;

    while (true) {
        boost::system::error_code ec;
        std::size_t n = stream.read_some(boost::asio::buffer(buffer), ec);
        if (n > 0) {
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                throw std::runtime_error("Write error on local file " + filename);
            }
            total_received += n;
            progress.update(total_received);
        }
        if (is_end_of_stream(ec)) break;
        if (ec) {
            throw protocol::FramingError("Error receiving file data after " +
                                         std::to_string(total_received) + " bytes: " + ec.message());
        }
    }
    progress.update(total_received, true);
    return total_received;
}

void close_stream(TlsStream& stream) {
    boost::system::error_code ec;
    stream.shutdown(ec);
    stream.lowest_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    stream.lowest_layer().close(ec);
}

} // namespace transfer
