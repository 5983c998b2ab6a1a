#include "FileHash.hpp"
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

static std::string to_hex(const unsigned char* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string md5_file_hex(const std::string& path, std::size_t chunkSize) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open for hashing: " + path);

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("EVP md5 init failed");
  }

  std::vector<char> buf(chunkSize == 0 ? 1 : chunkSize);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) {
      throw std::runtime_error("EVP md5 update failed: " + path);
    }
  }
  if (in.bad()) throw std::runtime_error("read error while hashing: " + path);

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    throw std::runtime_error("EVP md5 final failed");
  }
  return to_hex(digest, len);
}
