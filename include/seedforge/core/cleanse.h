// SEEDFORGE - Secret Wiping
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_CORE_CLEANSE_H
#define SEEDFORGE_CORE_CLEANSE_H

#include <openssl/crypto.h>

namespace seedforge {

/**
 * Overwrites a buffer with zeros when the scope ends, however it ends.
 * The buffer must outlive the guard; it is read through data() and
 * size() at destruction, so it may be reassigned in between.
 */
template<typename Buffer>
class CleanseOnExit {
public:
    explicit CleanseOnExit(Buffer& buffer) : buffer_(buffer) {}
    ~CleanseOnExit() {
        if (buffer_.size() != 0) {
            OPENSSL_cleanse(buffer_.data(), buffer_.size());
        }
    }

    CleanseOnExit(const CleanseOnExit&) = delete;
    CleanseOnExit& operator=(const CleanseOnExit&) = delete;

private:
    Buffer& buffer_;
};

} // namespace seedforge

#endif // SEEDFORGE_CORE_CLEANSE_H
