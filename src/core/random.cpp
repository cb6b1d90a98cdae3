// SEEDFORGE - Secure Random Number Generation Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/core/random.h"
#include "seedforge/core/error.h"

#include <cerrno>
#include <string>

// Platform-specific includes
#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace seedforge {

namespace detail {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    // getrandom() may return short reads for large requests or be interrupted
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        filled += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    // macOS/BSD: arc4random_buf always succeeds
    arc4random_buf(buf, len);
    return true;

#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw Error(ErrorCode::RandomSourceFailure,
                    "Failed to get " + std::to_string(len) + " random bytes from OS");
    }
}

Bytes GetRandBytes(size_t len) {
    Bytes out(len);
    GetRandBytes(out.data(), out.size());
    return out;
}

} // namespace seedforge
