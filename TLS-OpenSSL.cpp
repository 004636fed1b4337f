#include "TLS-OpenSSL.hpp"

#include <cerrno>
#include <cstring>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <glog/logging.h>

#include <fmt/format.h>

#include "POSIX.hpp"

TLS::~TLS()
{
  if (ssl_) {
    SSL_free(ssl_);
  }
  if (ctx_) {
    SSL_CTX_free(ctx_);
  }
}

static int verify_callback(int preverify_ok, X509_STORE_CTX* ctx)
{
  auto const cert = X509_STORE_CTX_get_current_cert(ctx);
  if (cert == nullptr)
    return preverify_ok;

  auto err = X509_STORE_CTX_get_error(ctx);

  auto const depth = X509_STORE_CTX_get_error_depth(ctx);

  char buf[256];
  X509_NAME_oneline(X509_get_subject_name(cert), buf, sizeof(buf));

  if (depth > Config::cert_verify_depth) {
    preverify_ok = 0;
    err          = X509_V_ERR_CERT_CHAIN_TOO_LONG;
    X509_STORE_CTX_set_error(ctx, err);
  }
  if (!preverify_ok) {
    LOG(WARNING) << "verify error:num=" << err << ':'
                 << X509_verify_cert_error_string(err) << ": depth=" << depth
                 << ':' << buf;
  }
  else {
    LOG(INFO) << "preverify_ok; depth=" << depth << " subject_name=«" << buf
              << "»";
  }

  if (!preverify_ok && (err == X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT)) {
    X509_NAME_oneline(X509_get_issuer_name(cert), buf, sizeof(buf));
    LOG(INFO) << "issuer=" << buf;
  }

  return preverify_ok;
}

bool TLS::starttls_client(int                       fd_in,
                          int                       fd_out,
                          char const*               server_name,
                          std::chrono::milliseconds timeout,
                          std::string&              err)
{
  CHECK(ssl_ == nullptr) << "TLS already started";

  OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS
                       | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                   nullptr);

  if (!RAND_status()) {
    err = "PRNG not seeded";
    return false;
  }

  ctx_ = SSL_CTX_new(TLS_client_method());
  if (ctx_ == nullptr) {
    err = ssl_error(SSL_ERROR_SSL);
    return false;
  }

  if (SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION) != 1) {
    err = "unable to set minimum TLS version";
    return false;
  }

  // you'd think if it's the default, you'd not have to call this
  if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
    err = "unable to load system trust store";
    return false;
  }

  SSL_CTX_set_verify_depth(ctx_, Config::cert_verify_depth + 1);
  SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, verify_callback);

  ssl_ = SSL_new(ctx_);
  if (ssl_ == nullptr) {
    err = ssl_error(SSL_ERROR_SSL);
    return false;
  }

  SSL_set_rfd(ssl_, fd_in);
  SSL_set_wfd(ssl_, fd_out);

  // No partial label wildcards
  SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);

  if (SSL_set1_host(ssl_, server_name) != 1) {
    err = fmt::format("can't set host name {} for verification", server_name);
    return false;
  }
  if (SSL_set_tlsext_host_name(ssl_, server_name) != 1) {
    err = fmt::format("can't set SNI name {}", server_name);
    return false;
  }

  auto const start = std::chrono::system_clock::now();

  ERR_clear_error();

  int rc;
  while ((rc = SSL_connect(ssl_)) != 1) {

    auto const now = std::chrono::system_clock::now();

    if (now >= (start + timeout)) {
      err = "TLS handshake timed out";
      return false;
    }

    auto time_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        (start + timeout) - now);

    int n_get_err;
    switch (n_get_err = SSL_get_error(ssl_, rc)) {
    case SSL_ERROR_WANT_READ:
      if (!POSIX::input_ready(fd_in, time_left)) {
        err = "TLS handshake timed out waiting for input";
        return false;
      }
      ERR_clear_error();
      continue; // try SSL_connect again

    case SSL_ERROR_WANT_WRITE:
      if (!POSIX::output_ready(fd_out, time_left)) {
        err = "TLS handshake timed out waiting for output";
        return false;
      }
      ERR_clear_error();
      continue; // try SSL_connect again

    case SSL_ERROR_SYSCALL:
      LOG(WARNING) << "errno == " << errno << ": " << strerror(errno);
      [[fallthrough]];

    default: {
      auto const vr = SSL_get_verify_result(ssl_);
      if (vr != X509_V_OK) {
        err = fmt::format("server certificate failed to verify: {}",
                          X509_verify_cert_error_string(vr));
        return false;
      }
      err = fmt::format("TLS handshake failed: {}", ssl_error(n_get_err));
      return false;
    }
    }
  }

  if (SSL_get_verify_result(ssl_) != X509_V_OK) {
    err = "server certificate failed to verify";
    return false;
  }

  LOG(INFO) << "server certificate verified";

  char const* const peername = SSL_get0_peername(ssl_);
  if (peername != nullptr) {
    verified_peername_ = peername;
    LOG(INFO) << "verified peername: " << peername;
  }

  return true;
}

std::string TLS::info() const
{
  auto const c = SSL_get_current_cipher(ssl_);
  if (c) {
    int alg_bits;
    int bits = SSL_CIPHER_get_bits(c, &alg_bits);
    return fmt::format("version={} cipher={} bits={}/{}",
                       SSL_CIPHER_get_version(c), SSL_CIPHER_get_name(c), bits,
                       alg_bits);
  }

  return "";
}

std::streamsize TLS::io_tls_(char const*                          fn,
                             std::function<int(SSL*, void*, int)> io_fnc,
                             char*                                s,
                             std::streamsize                      n,
                             std::chrono::milliseconds            timeout,
                             bool&                                t_o)
{
  auto const start    = std::chrono::system_clock::now();
  auto const end_time = start + timeout;

  ERR_clear_error();

  int n_ret;
  while ((n_ret = io_fnc(ssl_, static_cast<void*>(s), static_cast<int>(n)))
         < 0) {
    auto const now = std::chrono::system_clock::now();
    if (now > end_time) {
      LOG(WARNING) << fn << " timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    }

    auto const time_left
        = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - now);

    int n_get_err;
    switch (n_get_err = SSL_get_error(ssl_, n_ret)) {
    case SSL_ERROR_WANT_READ: {
      int fd = SSL_get_rfd(ssl_);
      CHECK_NE(-1, fd);
      if (POSIX::input_ready(fd, time_left)) {
        ERR_clear_error();
        continue; // try io_fnc again
      }
      LOG(WARNING) << fn << " timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    }

    case SSL_ERROR_WANT_WRITE: {
      int fd = SSL_get_wfd(ssl_);
      CHECK_NE(-1, fd);
      if (POSIX::output_ready(fd, time_left)) {
        ERR_clear_error();
        continue; // try io_fnc again
      }
      LOG(WARNING) << fn << " timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    }

    case SSL_ERROR_SYSCALL:
      LOG(WARNING) << "errno == " << errno << ": " << strerror(errno);
      [[fallthrough]];

    default:
      LOG(WARNING) << fn << ": " << ssl_error(n_get_err);
      return static_cast<std::streamsize>(-1);
    }
  }

  if (0 == n_ret) {
    int n_get_err;
    switch (n_get_err = SSL_get_error(ssl_, n_ret)) {
    case SSL_ERROR_NONE: LOG(INFO) << fn << " returned SSL_ERROR_NONE"; break;

    case SSL_ERROR_ZERO_RETURN:
      LOG(INFO) << fn << " returned SSL_ERROR_ZERO_RETURN";
      break;

    default:
      LOG(WARNING) << fn << " returned zero: " << ssl_error(n_get_err);
      return static_cast<std::streamsize>(-1);
    }
  }

  return static_cast<std::streamsize>(n_ret);
}

std::string TLS::ssl_error(int n_get_err)
{
  std::string ret;
  switch (n_get_err) {
  case SSL_ERROR_NONE: ret = "SSL_ERROR_NONE"; break;
  case SSL_ERROR_ZERO_RETURN: ret = "SSL_ERROR_ZERO_RETURN"; break;
  case SSL_ERROR_WANT_READ: ret = "SSL_ERROR_WANT_READ"; break;
  case SSL_ERROR_WANT_WRITE: ret = "SSL_ERROR_WANT_WRITE"; break;
  case SSL_ERROR_WANT_CONNECT: ret = "SSL_ERROR_WANT_CONNECT"; break;
  case SSL_ERROR_WANT_ACCEPT: ret = "SSL_ERROR_WANT_ACCEPT"; break;
  case SSL_ERROR_WANT_X509_LOOKUP: ret = "SSL_ERROR_WANT_X509_LOOKUP"; break;
  case SSL_ERROR_SYSCALL: ret = "SSL_ERROR_SYSCALL"; break;
  case SSL_ERROR_SSL: ret = "SSL_ERROR_SSL"; break;
  default: ret = fmt::format("SSL error {}", n_get_err); break;
  }
  unsigned long er;
  while (0 != (er = ERR_get_error())) {
    char buf[256];
    ERR_error_string_n(er, buf, sizeof(buf));
    LOG(WARNING) << buf;
    ret += "; ";
    ret += buf;
  }
  return ret;
}
