// SEEDFORGE - Prime-Order Elliptic Curve Groups Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/crypto/ecgroup.h"
#include "seedforge/core/error.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <stdexcept>

namespace seedforge {

namespace {

struct BNClearDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};

struct BNCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

struct ECPointDeleter {
    void operator()(EC_POINT* p) const { EC_POINT_clear_free(p); }
};

using BNPtr = std::unique_ptr<BIGNUM, BNClearDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using ECPointPtr = std::unique_ptr<EC_POINT, ECPointDeleter>;

/// Load a 32-byte big-endian secret into a constant-time BIGNUM
BNPtr LoadScalar(const Byte* bytes) {
    BNPtr bn(BN_secure_new());
    if (!bn || !BN_bin2bn(bytes, static_cast<int>(ECGroup::PRIVATE_KEY_SIZE), bn.get())) {
        throw std::runtime_error("BIGNUM allocation failed");
    }
    BN_set_flags(bn.get(), BN_FLG_CONSTTIME);
    return bn;
}

BNCtxPtr NewContext() {
    BNCtxPtr ctx(BN_CTX_secure_new());
    if (!ctx) {
        throw std::runtime_error("BN_CTX allocation failed");
    }
    return ctx;
}

} // namespace

struct ECGroup::Impl {
    EC_GROUP* group{nullptr};
    BIGNUM* order{nullptr};

    explicit Impl(int nid) {
        group = EC_GROUP_new_by_curve_name(nid);
        order = BN_new();
        if (!group || !order || EC_GROUP_get_order(group, order, nullptr) != 1) {
            EC_GROUP_free(group);
            BN_free(order);
            throw std::runtime_error("Unsupported elliptic curve");
        }
    }

    ~Impl() {
        EC_GROUP_free(group);
        BN_free(order);
    }
};

ECGroup::ECGroup(int nid, std::string name)
    : impl_(std::make_unique<Impl>(nid)), name_(std::move(name)) {
}

ECGroup::~ECGroup() = default;

const ECGroup& ECGroup::Secp256k1() {
    static const ECGroup group(NID_secp256k1, "secp256k1");
    return group;
}

const ECGroup& ECGroup::Nist256p1() {
    static const ECGroup group(NID_X9_62_prime256v1, "nist256p1");
    return group;
}

bool ECGroup::IsValidPrivateKey(const Byte* key) const {
    BNPtr k = LoadScalar(key);
    return !BN_is_zero(k.get()) && BN_cmp(k.get(), impl_->order) < 0;
}

bool ECGroup::PrivateKeyTweakAdd(const Byte* key, const Byte* tweak, Byte* result) const {
    BNPtr k = LoadScalar(key);
    BNPtr t = LoadScalar(tweak);
    if (BN_cmp(t.get(), impl_->order) >= 0) {
        return false;
    }

    BNCtxPtr ctx = NewContext();
    BNPtr sum(BN_secure_new());
    if (!sum || BN_mod_add(sum.get(), k.get(), t.get(), impl_->order, ctx.get()) != 1) {
        throw std::runtime_error("BN_mod_add failed");
    }
    if (BN_is_zero(sum.get())) {
        return false;
    }

    if (BN_bn2binpad(sum.get(), result, static_cast<int>(PRIVATE_KEY_SIZE)) !=
        static_cast<int>(PRIVATE_KEY_SIZE)) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return true;
}

ECGroup::CompressedPoint ECGroup::GetPublicKey(const Byte* key) const {
    if (!IsValidPrivateKey(key)) {
        throw Error(ErrorCode::InvalidKey, "Private key out of range for " + name_);
    }

    BNPtr k = LoadScalar(key);
    BNCtxPtr ctx = NewContext();
    ECPointPtr point(EC_POINT_new(impl_->group));
    if (!point || EC_POINT_mul(impl_->group, point.get(), k.get(),
                               nullptr, nullptr, ctx.get()) != 1) {
        throw std::runtime_error("EC point multiplication failed");
    }

    CompressedPoint out{};
    size_t len = EC_POINT_point2oct(impl_->group, point.get(),
                                    POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), ctx.get());
    if (len != COMPRESSED_SIZE) {
        throw std::runtime_error("EC point serialization failed");
    }
    return out;
}

} // namespace seedforge
