// sufidx/src/sort_keys.cpp
#include "sufidx/sort_keys.h"

#include <string_view>

namespace sufidx {

static inline int sign_of(int c) {
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

int PrefixKey::compare(uint32_t a, uint32_t b) const {
    if (a == b) return 0;
    // char_traits<char> compares as unsigned char
    return sign_of(text_.view(a, width_).compare(text_.view(b, width_)));
}

int ExactKey::compare(uint32_t a, uint32_t b) const {
    if (a == b) return 0;
    size_t pa = a;
    size_t pb = b;
    while (true) {
        const std::string_view ca = text_.view(pa, chunk_);
        const std::string_view cb = text_.view(pb, chunk_);
        const int c = ca.compare(cb);
        if (c != 0) return sign_of(c);
        if (ca.size() < chunk_) return 0; // both ran off the end together
        pa += chunk_;
        pb += chunk_;
    }
}

} // namespace sufidx
