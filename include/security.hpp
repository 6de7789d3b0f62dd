#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <boost/asio/ssl.hpp>

namespace security {

class TransportSecurityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr const char* CERT_ORGANIZATION = "LanFerry";
constexpr std::chrono::hours CERT_VALIDITY{24};

// PEM-encoded self-signed certificate and its RSA private key.
struct Credential {
    std::string certificate_pem;
    std::string private_key_pem;
};

// Fresh RSA-2048 key and a self-signed certificate valid from now for
// `validity`. Nothing is written to disk.
Credential generate_credential(std::chrono::seconds validity = CERT_VALIDITY);

// TLS context shared by the listening and the connecting side. It presents
// an ephemeral credential and does not verify the remote certificate.
std::unique_ptr<boost::asio::ssl::context> create_transport_context();

} // namespace security
