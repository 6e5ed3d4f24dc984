/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/stark_curve.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>

#include "crypto/rfc6979.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attestor::crypto, StarkCurveError, e) {
  using E = attestor::crypto::StarkCurveError;
  switch (e) {
    case E::INVALID_PRIVATE_KEY:
      return "Private key must be non-zero and below the curve order";
    case E::MESSAGE_HASH_OUT_OF_RANGE:
      return "Message hash must be below 2^251";
    case E::INVALID_K:
      return "Nonce produced an out-of-range signature component";
  }
  return "Unknown StarkCurveError";
}

namespace attestor::crypto {

  namespace {
    const uint256_t &upperBound() {
      static const uint256_t bound = uint256_t{1} << 251;
      return bound;
    }

    Felt parseConstant(std::string_view hex) {
      // compile-time constants of the curve, always valid
      return Felt::fromHex(hex).value();
    }

    struct OpensslFree {
      void operator()(BIGNUM *bn) const {
        BN_clear_free(bn);
      }
      void operator()(BN_CTX *ctx) const {
        BN_CTX_free(ctx);
      }
      void operator()(EC_GROUP *group) const {
        EC_GROUP_free(group);
      }
      void operator()(EC_POINT *point) const {
        EC_POINT_clear_free(point);
      }
    };
    template <typename T>
    using Owned = std::unique_ptr<T, OpensslFree>;

    void ensure(bool ok, const char *what) {
      if (not ok) {
        throw std::runtime_error{what};
      }
    }

    Owned<BIGNUM> toBn(const Felt &value) {
      auto bytes = value.toBytesBe();
      Owned<BIGNUM> bn{
          BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr)};
      ensure(bn != nullptr, "BN_bin2bn failed");
      return bn;
    }

    Owned<BIGNUM> hexBn(const char *hex) {
      BIGNUM *bn = nullptr;
      ensure(BN_hex2bn(&bn, hex) != 0, "BN_hex2bn failed");
      return Owned<BIGNUM>{bn};
    }

    Felt fromBn(const BIGNUM *bn) {
      qtils::ByteArr<32> bytes;
      const auto size = static_cast<int>(bytes.size());
      ensure(BN_bn2binpad(bn, bytes.data(), size) == size,
             "BN_bn2binpad failed");
      return Felt::fromBytesBe(bytes);
    }

    Owned<BN_CTX> newContext() {
      Owned<BN_CTX> ctx{BN_CTX_new()};
      ensure(ctx != nullptr, "BN_CTX_new failed");
      return ctx;
    }

    // Stark curve as an OpenSSL prime field group, cofactor 1
    const EC_GROUP &group() {
      static const Owned<EC_GROUP> group = [] {
        auto ctx = newContext();
        auto p = hexBn(
            "800000000000011000000000000000000000000000000000000000000000001");
        auto a = hexBn("1");
        auto b = hexBn(
            "6f21413efbe40de150e596d72f7a8c5609ad26c15c915c1f4cdfcb99cee9e89");
        Owned<EC_GROUP> group{
            EC_GROUP_new_curve_GFp(p.get(), a.get(), b.get(), ctx.get())};
        ensure(group != nullptr, "EC_GROUP_new_curve_GFp failed");

        Owned<EC_POINT> g{EC_POINT_new(group.get())};
        ensure(g != nullptr, "EC_POINT_new failed");
        auto gx = toBn(generator().x);
        auto gy = toBn(generator().y);
        ensure(EC_POINT_set_affine_coordinates(
                   group.get(), g.get(), gx.get(), gy.get(), ctx.get())
                   == 1,
               "Stark generator rejected");
        auto order = toBn(Felt::fromBig(curveOrder()));
        auto cofactor = hexBn("1");
        ensure(EC_GROUP_set_generator(
                   group.get(), g.get(), order.get(), cofactor.get())
                   == 1,
               "EC_GROUP_set_generator failed");
        return group;
      }();
      return *group;
    }

    /// nullptr if @param point is not on the curve
    Owned<EC_POINT> toPoint(const AffinePoint &point, BN_CTX *ctx) {
      Owned<EC_POINT> result{EC_POINT_new(&group())};
      ensure(result != nullptr, "EC_POINT_new failed");
      if (point.infinity) {
        ensure(EC_POINT_set_to_infinity(&group(), result.get()) == 1,
               "EC_POINT_set_to_infinity failed");
        return result;
      }
      auto x = toBn(point.x);
      auto y = toBn(point.y);
      if (EC_POINT_set_affine_coordinates(
              &group(), result.get(), x.get(), y.get(), ctx)
          != 1) {
        ERR_clear_error();
        return nullptr;
      }
      return result;
    }

    AffinePoint fromPoint(const EC_POINT *point, BN_CTX *ctx) {
      if (EC_POINT_is_at_infinity(&group(), point) == 1) {
        return {.infinity = true};
      }
      Owned<BIGNUM> x{BN_new()};
      Owned<BIGNUM> y{BN_new()};
      ensure(x != nullptr and y != nullptr, "BN_new failed");
      ensure(EC_POINT_get_affine_coordinates(
                 &group(), point, x.get(), y.get(), ctx)
                 == 1,
             "EC_POINT_get_affine_coordinates failed");
      return {fromBn(x.get()), fromBn(y.get()), false};
    }

    uint256_t mulMod(const uint256_t &a, const uint256_t &b) {
      uint512_t product = uint512_t{a} * b;
      return static_cast<uint256_t>(product % uint512_t{curveOrder()});
    }

    uint256_t addMod(const uint256_t &a, const uint256_t &b) {
      uint512_t sum = uint512_t{a} + b;
      return static_cast<uint256_t>(sum % uint512_t{curveOrder()});
    }

    uint256_t invMod(const uint256_t &a) {
      uint256_t result = 1;
      uint256_t base = a % curveOrder();
      uint256_t e = curveOrder() - 2;
      while (not e.is_zero()) {
        if (boost::multiprecision::bit_test(e, 0)) {
          result = mulMod(result, base);
        }
        base = mulMod(base, base);
        e >>= 1;
      }
      return result;
    }

    bool inSignatureRange(const uint256_t &value) {
      return not value.is_zero() and value < upperBound();
    }
  }  // namespace

  const uint256_t &curveOrder() {
    static const uint256_t order = parseConstant(
        "0x800000000000010ffffffffffffffffb781126dcae7b2321e66a241adc64d2f")
                                       .value();
    return order;
  }

  const AffinePoint &generator() {
    static const AffinePoint g{
        parseConstant("0x1ef15c18599971b7beced415a40f0c7deacfd9b0d1819e03d723d8"
                      "bc943cfca"),
        parseConstant("0x5668060aa49730b7be4801df46ec62de53ecd11abe43a328730"
                      "00c36e8dc1f"),
        false,
    };
    return g;
  }

  AffinePoint multiply(const uint256_t &k, const AffinePoint &point) {
    auto ctx = newContext();
    auto base = toPoint(point, ctx.get());
    if (base == nullptr) {
      throw std::invalid_argument{"Point is not on the Stark curve"};
    }
    auto reduced = k % curveOrder();
    if (reduced.is_zero()) {
      return {.infinity = true};
    }
    auto scalar = toBn(Felt::fromBig(reduced));
    BN_set_flags(scalar.get(), BN_FLG_CONSTTIME);

    // single point multiplication runs the Montgomery ladder
    Owned<EC_POINT> result{EC_POINT_new(&group())};
    ensure(result != nullptr, "EC_POINT_new failed");
    ensure(EC_POINT_mul(&group(),
                        result.get(),
                        nullptr,
                        base.get(),
                        scalar.get(),
                        ctx.get())
               == 1,
           "EC_POINT_mul failed");
    return fromPoint(result.get(), ctx.get());
  }

  AffinePoint add(const AffinePoint &a, const AffinePoint &b) {
    auto ctx = newContext();
    auto pa = toPoint(a, ctx.get());
    auto pb = toPoint(b, ctx.get());
    if (pa == nullptr or pb == nullptr) {
      throw std::invalid_argument{"Point is not on the Stark curve"};
    }
    Owned<EC_POINT> sum{EC_POINT_new(&group())};
    ensure(sum != nullptr, "EC_POINT_new failed");
    ensure(EC_POINT_add(&group(), sum.get(), pa.get(), pb.get(), ctx.get())
               == 1,
           "EC_POINT_add failed");
    return fromPoint(sum.get(), ctx.get());
  }

  bool isOnCurve(const AffinePoint &point) {
    auto ctx = newContext();
    return toPoint(point, ctx.get()) != nullptr;
  }

  outcome::result<AffinePoint> derivePublicKey(const Felt &private_key) {
    if (private_key.isZero() or private_key.value() >= curveOrder()) {
      return StarkCurveError::INVALID_PRIVATE_KEY;
    }
    return multiply(private_key.value(), generator());
  }

  outcome::result<StarkSignature> signWithK(const Felt &private_key,
                                            const Felt &message_hash,
                                            const uint256_t &k) {
    if (private_key.isZero() or private_key.value() >= curveOrder()) {
      return StarkCurveError::INVALID_PRIVATE_KEY;
    }
    if (message_hash.value() >= upperBound()) {
      return StarkCurveError::MESSAGE_HASH_OUT_OF_RANGE;
    }
    if (k.is_zero() or k >= curveOrder()) {
      return StarkCurveError::INVALID_K;
    }

    auto r = multiply(k, generator()).x.value();
    if (not inSignatureRange(r)) {
      return StarkCurveError::INVALID_K;
    }

    auto s = mulMod(addMod(mulMod(r, private_key.value()),
                           message_hash.value()),
                    invMod(k));
    if (not inSignatureRange(s)) {
      return StarkCurveError::INVALID_K;
    }
    return StarkSignature{Felt::fromBig(r), Felt::fromBig(s)};
  }

  outcome::result<StarkSignature> sign(const Felt &private_key,
                                       const Felt &message_hash) {
    uint256_t seed = 0;
    while (true) {
      auto k =
          generateK(message_hash, private_key.value(), seed, curveOrder());
      auto signature = signWithK(private_key, message_hash, k);
      if (signature.has_value()) {
        return signature;
      }
      if (signature.error() != StarkCurveError::INVALID_K) {
        return signature.error();
      }
      ++seed;
    }
  }

  bool verify(const AffinePoint &public_key,
              const Felt &message_hash,
              const StarkSignature &signature) {
    const auto &r = signature.r.value();
    const auto &s = signature.s.value();
    if (not inSignatureRange(r) or not inSignatureRange(s)
        or s >= curveOrder()) {
      return false;
    }
    if (message_hash.value() >= upperBound() or public_key.infinity
        or not isOnCurve(public_key)) {
      return false;
    }
    auto w = invMod(s);
    auto u1 = mulMod(message_hash.value(), w);
    auto u2 = mulMod(r, w);
    auto point = add(multiply(u1, generator()), multiply(u2, public_key));
    return not point.infinity and point.x.value() == r;
  }

}  // namespace attestor::crypto
