#include "tagchunk/crypto.hpp"
#include "tagchunk/logging.hpp"
#include <sodium.h>

namespace tagchunk {

SodiumSealer::SodiumSealer() {
  ready_ = sodium_init() >= 0;
  if (!ready_)
    Logger::instance().log(LogLevel::ERROR, "sodium_init failed");
  key_.assign(crypto_aead_xchacha20poly1305_ietf_KEYBYTES, 0);
}

size_t SodiumSealer::overhead() {
  return crypto_aead_xchacha20poly1305_ietf_NPUBBYTES +
         crypto_aead_xchacha20poly1305_ietf_ABYTES;
}

void SodiumSealer::set_key(const std::vector<uint8_t> &key) {
  key_.assign(crypto_aead_xchacha20poly1305_ietf_KEYBYTES, 0);
  if (key.size() == crypto_aead_xchacha20poly1305_ietf_KEYBYTES)
    key_ = key;
  else if (!key.empty())
    crypto_generichash(key_.data(), key_.size(), key.data(), key.size(),
                       nullptr, 0);
}

bool SodiumSealer::seal(std::vector<uint8_t> &inout) {
  if (!ready_)
    return false;
  const size_t nlen = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
  std::vector<uint8_t> out(nlen + inout.size() +
                           crypto_aead_xchacha20poly1305_ietf_ABYTES);
  randombytes_buf(out.data(), nlen);
  unsigned long long clen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_encrypt(
          out.data() + nlen, &clen, inout.data(), inout.size(), nullptr, 0,
          nullptr, out.data(), key_.data()) != 0)
    return false;
  out.resize(nlen + (size_t)clen);
  inout.swap(out);
  return true;
}

bool SodiumSealer::open(std::vector<uint8_t> &inout) {
  if (!ready_)
    return false;
  if (inout.size() < overhead()) {
    Logger::instance().log(LogLevel::DEBUG, "sealed payload too short: %zu",
                           inout.size());
    return false;
  }
  const size_t nlen = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
  std::vector<uint8_t> out(inout.size() - overhead());
  unsigned long long outlen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_decrypt(
          out.data(), &outlen, nullptr, inout.data() + nlen,
          inout.size() - nlen, nullptr, 0, inout.data(), key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

} // namespace tagchunk
