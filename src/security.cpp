#include "security.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <sodium.h>

namespace security {

namespace {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
struct ExtDeleter { void operator()(X509_EXTENSION* p) const { X509_EXTENSION_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string openssl_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) return what;
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return what + ": " + buf;
}

PkeyPtr generate_key() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        throw TransportSecurityError(openssl_error("Key context creation failed"));
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) <= 0) {
        throw TransportSecurityError(openssl_error("Key generation setup failed"));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw TransportSecurityError(openssl_error("Key generation failed"));
    }
    return PkeyPtr(raw);
}

void add_extension(X509* cert, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    std::unique_ptr<X509_EXTENSION, ExtDeleter> ext(
        X509V3_EXT_conf_nid(nullptr, &ctx, nid, const_cast<char*>(value)));
    if (!ext || X509_add_ext(cert, ext.get(), -1) != 1) {
        throw TransportSecurityError(openssl_error("Certificate extension encoding failed"));
    }
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<std::size_t>(len));
}

} // namespace

Credential generate_credential(std::chrono::seconds validity) {
    if (sodium_init() < 0) {
        throw TransportSecurityError("libsodium initialization failed");
    }

    PkeyPtr pkey = generate_key();

    X509Ptr x509(X509_new());
    if (!x509) {
        throw TransportSecurityError(openssl_error("Certificate allocation failed"));
    }

    X509_set_version(x509.get(), 2);
    // Random serial so two runs never issue look-alike certificates
    ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), static_cast<long>(randombytes_random() >> 1));
    X509_gmtime_adj(X509_get_notBefore(x509.get()), 0);
    X509_gmtime_adj(X509_get_notAfter(x509.get()), static_cast<long>(validity.count()));
    X509_set_pubkey(x509.get(), pkey.get());

    X509_NAME* name = X509_get_subject_name(x509.get());
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(CERT_ORGANIZATION), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("lanferry"), -1, -1, 0);
    X509_set_issuer_name(x509.get(), name);

    add_extension(x509.get(), NID_basic_constraints, "critical,CA:FALSE");
    add_extension(x509.get(), NID_key_usage, "digitalSignature,keyEncipherment");
    add_extension(x509.get(), NID_ext_key_usage, "serverAuth");

    if (X509_sign(x509.get(), pkey.get(), EVP_sha256()) <= 0) {
        throw TransportSecurityError(openssl_error("Certificate signing failed"));
    }

    BioPtr cert_bio(BIO_new(BIO_s_mem()));
    BioPtr key_bio(BIO_new(BIO_s_mem()));
    if (!cert_bio || !key_bio ||
        PEM_write_bio_X509(cert_bio.get(), x509.get()) != 1 ||
        PEM_write_bio_PrivateKey(key_bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw TransportSecurityError(openssl_error("Credential PEM encoding failed"));
    }

    return Credential{bio_to_string(cert_bio.get()), bio_to_string(key_bio.get())};
}

std::unique_ptr<boost::asio::ssl::context> create_transport_context() {
    Credential credential = generate_credential();

    auto ctx = std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls);
    ctx->set_options(boost::asio::ssl::context::default_workarounds |
                     boost::asio::ssl::context::no_sslv2 |
                     boost::asio::ssl::context::no_sslv3 |
                     boost::asio::ssl::context::no_tlsv1 |
                     boost::asio::ssl::context::no_tlsv1_1);

    try {
        ctx->use_certificate(boost::asio::buffer(credential.certificate_pem),
                             boost::asio::ssl::context::pem);
        ctx->use_private_key(boost::asio::buffer(credential.private_key_pem),
                             boost::asio::ssl::context::pem);
    } catch (const boost::system::system_error& e) {
        throw TransportSecurityError(std::string("Loading credential into TLS context failed: ") + e.what());
    }

    // Peers are not authenticated, the channel only provides confidentiality
    // and integrity of the byte stream.
    ctx->set_verify_mode(boost::asio::ssl::verify_none);
    return ctx;
}

} // namespace security
