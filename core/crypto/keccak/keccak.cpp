/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#ifndef ROTL64
#define ROTL64(x, y) (((x) << (y)) | ((x) >> (64 - (y))))
#endif

namespace x402::crypto::keccak {
  static const std::array<uint64_t, 24> round_constants{
      0x0000000000000001, 0x0000000000008082, 0x800000000000808A,
      0x8000000080008000, 0x000000000000808B, 0x0000000080000001,
      0x8000000080008081, 0x8000000000008009, 0x000000000000008A,
      0x0000000000000088, 0x0000000080008009, 0x000000008000000A,
      0x000000008000808B, 0x800000000000008B, 0x8000000000008089,
      0x8000000000008003, 0x8000000000008002, 0x8000000000000080,
      0x000000000000800A, 0x800000008000000A, 0x8000000080008081,
      0x8000000000008080, 0x0000000080000001, 0x8000000080008008,
  };
  static const std::array<uint8_t, 24> rotations{
      1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
      27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44,
  };
  static const std::array<uint8_t, 24> pi_lanes{
      10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
      15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1,
  };

  inline void keccakF1600(std::array<uint64_t, 25> &st) {
    std::array<uint64_t, 5> bc{};
    for (const auto rc : round_constants) {
      // theta
      for (size_t i = 0; i < 5; ++i) {
        bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
      }
      for (size_t i = 0; i < 5; ++i) {
        const uint64_t t = bc[(i + 4) % 5] ^ ROTL64(bc[(i + 1) % 5], 1);
        for (size_t j = 0; j < 25; j += 5) {
          st[j + i] ^= t;
        }
      }
      // rho and pi
      uint64_t t = st[1];
      for (size_t i = 0; i < 24; ++i) {
        const auto j = pi_lanes[i];
        bc[0] = st[j];
        st[j] = ROTL64(t, rotations[i]);
        t = bc[0];
      }
      // chi
      for (size_t j = 0; j < 25; j += 5) {
        for (size_t i = 0; i < 5; ++i) {
          bc[i] = st[j + i];
        }
        for (size_t i = 0; i < 5; ++i) {
          st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }
      }
      // iota
      st[0] ^= rc;
    }
  }

  void Ctx::absorb() {
    for (size_t i = 0; i < kRate / 8; ++i) {
      uint64_t lane = 0;
      for (size_t b = 0; b < 8; ++b) {
        lane |= static_cast<uint64_t>(block[i * 8 + b]) << (8 * b);
      }
      state[i] ^= lane;
    }
    keccakF1600(state);
  }

  void Ctx::update(BytesIn in) {
    for (const auto byte : in) {
      block[offset++] = byte;
      if (offset == kRate) {
        absorb();
        offset = 0;
      }
    }
  }

  Hash256 Ctx::final() {
    std::fill(block.begin() + offset, block.end(), 0);
    block[offset] ^= 0x01;
    block[kRate - 1] ^= 0x80;
    absorb();
    offset = 0;
    Hash256 hash;
    for (size_t i = 0; i < hash.size(); ++i) {
      hash[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    }
    return hash;
  }

  Hash256 keccak256(BytesIn to_hash) {
    Ctx ctx;
    ctx.update(to_hash);
    return ctx.final();
  }
}  // namespace x402::crypto::keccak
