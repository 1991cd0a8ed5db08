// frontend/include/php2ir/text/Span.hpp
#pragma once
#include <cstdint>


namespace php2ir {

    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive
    };

    /// @brief 두 span을 감싸는 span을 만든다. file이 다르면 a를 그대로 쓴다.
    inline Span join(Span a, Span b) {
        if (a.file_id != b.file_id) return a;
        Span s = a;
        s.lo = (a.lo < b.lo) ? a.lo : b.lo;
        s.hi = (a.hi > b.hi) ? a.hi : b.hi;
        return s;
    }

} // namespace php2ir
