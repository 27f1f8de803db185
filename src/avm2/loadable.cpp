#include <fusion/avm2/loadable.h>

#include <cmath>

#include <fusion/avm2/util.h>

namespace fusion::avm2 {

Instruction push_integer(int64_t v) {
    if (v >= -128 && v <= 127) return ins::pushbyte(v);
    if (v >= 0 && v <= U32_MAX) return ins::pushuint(v);
    if (v < 0 && v >= S32_MIN) return ins::pushint(v);
    return ins::pushdouble(static_cast<double>(v));
}

Instruction push_integer(uint64_t v) {
    if (v <= static_cast<uint64_t>(U32_MAX)) return push_integer(static_cast<int64_t>(v));
    return ins::pushdouble(static_cast<double>(v));
}

Instruction push_number(double v) {
    if (std::isnan(v)) return ins::make(Op::PUSHNAN);
    return ins::pushdouble(v);
}

} // namespace fusion::avm2
