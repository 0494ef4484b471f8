/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace beacon::crypto {
  namespace {
    using EvpMdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    void check(int openssl_result) {
      if (openssl_result != 1) {
        throw std::runtime_error{"OpenSSL SHA-256 failure"};
      }
    }
  }  // namespace

  Hash256 sha256(std::string_view input) {
    return sha256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }

  Hash256 sha256(qtils::ByteView input) {
    return sha256(std::initializer_list<qtils::ByteView>{input});
  }

  Hash256 sha256(std::initializer_list<qtils::ByteView> parts) {
    EvpMdCtx ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (ctx == nullptr) {
      throw std::bad_alloc{};
    }
    check(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr));
    for (auto &part : parts) {
      check(EVP_DigestUpdate(ctx.get(), part.data(), part.size()));
    }
    Hash256 out;
    unsigned int size = 0;
    check(EVP_DigestFinal_ex(ctx.get(), out.data(), &size));
    return out;
  }
}  // namespace beacon::crypto
