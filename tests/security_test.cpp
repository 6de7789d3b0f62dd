#include <gtest/gtest.h>
#include <ctime>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "security.hpp"

namespace {

X509* parse_certificate(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return cert;
}

std::string subject_entry(X509* cert, int nid) {
    char buf[256] = {0};
    X509_NAME_get_text_by_NID(X509_get_subject_name(cert), nid, buf, sizeof(buf));
    return buf;
}

} // namespace

TEST(SecurityTest, CredentialIsSelfSignedForOrganization) {
    auto credential = security::generate_credential();
    ASSERT_NE(credential.certificate_pem.find("BEGIN CERTIFICATE"), std::string::npos);
    ASSERT_NE(credential.private_key_pem.find("PRIVATE KEY"), std::string::npos);

    X509* cert = parse_certificate(credential.certificate_pem);
    ASSERT_NE(cert, nullptr);
    EXPECT_EQ(subject_entry(cert, NID_organizationName), security::CERT_ORGANIZATION);
    EXPECT_EQ(X509_NAME_cmp(X509_get_subject_name(cert), X509_get_issuer_name(cert)), 0);

    EVP_PKEY* key = X509_get0_pubkey(cert);
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(X509_verify(cert, key), 1);
    X509_free(cert);
}

TEST(SecurityTest, ValidityWindowIsOneDay) {
    auto credential = security::generate_credential();
    X509* cert = parse_certificate(credential.certificate_pem);
    ASSERT_NE(cert, nullptr);

    time_t now = time(nullptr);
    time_t in_23h = now + 23 * 3600;
    time_t in_25h = now + 25 * 3600;
    // valid now, still valid in 23h, expired in 25h
    EXPECT_LE(X509_cmp_time(X509_get0_notBefore(cert), &now), 0);
    EXPECT_GT(X509_cmp_time(X509_get0_notAfter(cert), &in_23h), 0);
    EXPECT_LT(X509_cmp_time(X509_get0_notAfter(cert), &in_25h), 0);
    X509_free(cert);
}

TEST(SecurityTest, EveryCredentialIsFresh) {
    auto first = security::generate_credential();
    auto second = security::generate_credential();
    EXPECT_NE(first.private_key_pem, second.private_key_pem);
    EXPECT_NE(first.certificate_pem, second.certificate_pem);
}

TEST(SecurityTest, TransportContextSkipsPeerVerification) {
    auto ctx = security::create_transport_context();
    ASSERT_NE(ctx, nullptr);
    EXPECT_EQ(SSL_CTX_get_verify_mode(ctx->native_handle()), SSL_VERIFY_NONE);
    EXPECT_NE(SSL_CTX_get0_certificate(ctx->native_handle()), nullptr);
}
