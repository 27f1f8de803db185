/**
 * @file op_codes.h
 * @brief AVM2 opcodes plus the bookkeeping pseudo-ops the code generator emits
 */
#pragma once
#include <cstdint>
#include <meow_enum.h>

namespace fusion::avm2 {

enum class Op : uint8_t {
    BKPT = 0x01, NOP = 0x02, THROW = 0x03, GETSUPER = 0x04, SETSUPER = 0x05,
    DXNS = 0x06, DXNSLATE = 0x07, KILL = 0x08, LABEL = 0x09,

    IFNLT = 0x0C, IFNLE = 0x0D, IFNGT = 0x0E, IFNGE = 0x0F,
    JUMP = 0x10, IFTRUE = 0x11, IFFALSE = 0x12, IFEQ = 0x13, IFNE = 0x14,
    IFLT = 0x15, IFLE = 0x16, IFGT = 0x17, IFGE = 0x18,
    IFSTRICTEQ = 0x19, IFSTRICTNE = 0x1A, LOOKUPSWITCH = 0x1B,

    PUSHWITH = 0x1C, POPSCOPE = 0x1D, NEXTNAME = 0x1E, HASNEXT = 0x1F,
    PUSHNULL = 0x20, PUSHUNDEFINED = 0x21, NEXTVALUE = 0x23,
    PUSHBYTE = 0x24, PUSHSHORT = 0x25, PUSHTRUE = 0x26, PUSHFALSE = 0x27, PUSHNAN = 0x28,
    POP = 0x29, DUP = 0x2A, SWAP = 0x2B,
    PUSHSTRING = 0x2C, PUSHINT = 0x2D, PUSHUINT = 0x2E, PUSHDOUBLE = 0x2F,
    PUSHSCOPE = 0x30, PUSHNAMESPACE = 0x31, HASNEXT2 = 0x32,

    NEWFUNCTION = 0x40, CALL = 0x41, CONSTRUCT = 0x42, CALLMETHOD = 0x43, CALLSTATIC = 0x44,
    CALLSUPER = 0x45, CALLPROPERTY = 0x46, RETURNVOID = 0x47, RETURNVALUE = 0x48,
    CONSTRUCTSUPER = 0x49, CONSTRUCTPROP = 0x4A, CALLPROPLEX = 0x4C,
    CALLSUPERVOID = 0x4E, CALLPROPVOID = 0x4F, APPLYTYPE = 0x53,
    NEWOBJECT = 0x55, NEWARRAY = 0x56, NEWACTIVATION = 0x57, NEWCLASS = 0x58,
    GETDESCENDANTS = 0x59, NEWCATCH = 0x5A,

    FINDPROPSTRICT = 0x5D, FINDPROPERTY = 0x5E, GETLEX = 0x60, SETPROPERTY = 0x61,
    GETLOCAL = 0x62, SETLOCAL = 0x63, GETGLOBALSCOPE = 0x64, GETSCOPEOBJECT = 0x65,
    GETPROPERTY = 0x66, INITPROPERTY = 0x68, DELETEPROPERTY = 0x6A,
    GETSLOT = 0x6C, SETSLOT = 0x6D, GETGLOBALSLOT = 0x6E, SETGLOBALSLOT = 0x6F,

    CONVERT_S = 0x70, ESC_XELEM = 0x71, ESC_XATTR = 0x72, CONVERT_I = 0x73,
    CONVERT_U = 0x74, CONVERT_D = 0x75, CONVERT_B = 0x76, CONVERT_O = 0x77, CHECKFILTER = 0x78,

    COERCE = 0x80, COERCE_B = 0x81, COERCE_A = 0x82, COERCE_I = 0x83, COERCE_D = 0x84,
    COERCE_S = 0x85, ASTYPE = 0x86, ASTYPELATE = 0x87, COERCE_U = 0x88, COERCE_O = 0x89,

    NEGATE = 0x90, INCREMENT = 0x91, INCLOCAL = 0x92, DECREMENT = 0x93, DECLOCAL = 0x94,
    TYPEOF = 0x95, NOT = 0x96, BITNOT = 0x97,

    ADD = 0xA0, SUBTRACT = 0xA1, MULTIPLY = 0xA2, DIVIDE = 0xA3, MODULO = 0xA4,
    LSHIFT = 0xA5, RSHIFT = 0xA6, URSHIFT = 0xA7, BITAND = 0xA8, BITOR = 0xA9, BITXOR = 0xAA,
    EQUALS = 0xAB, STRICTEQUALS = 0xAC, LESSTHAN = 0xAD, LESSEQUALS = 0xAE,
    GREATERTHAN = 0xAF, GREATEREQUALS = 0xB0, INSTANCEOF = 0xB1, ISTYPE = 0xB2,
    ISTYPELATE = 0xB3, IN = 0xB4,

    INCREMENT_I = 0xC0, DECREMENT_I = 0xC1, INCLOCAL_I = 0xC2, DECLOCAL_I = 0xC3,
    NEGATE_I = 0xC4, ADD_I = 0xC5, SUBTRACT_I = 0xC6, MULTIPLY_I = 0xC7,

    GETLOCAL_0 = 0xD0, GETLOCAL_1 = 0xD1, GETLOCAL_2 = 0xD2, GETLOCAL_3 = 0xD3,
    SETLOCAL_0 = 0xD4, SETLOCAL_1 = 0xD5, SETLOCAL_2 = 0xD6, SETLOCAL_3 = 0xD7,

    DEBUG = 0xEF, DEBUGLINE = 0xF0, DEBUGFILE = 0xF1,

    // --- Pseudo ops (never serialized) ---
    BEGINTRY = 0xFB, ENDTRY = 0xFC, ADDEXCINFO = 0xFD, BEGINCATCH = 0xFE,
};

// Which constant pool an op's first operand is interned into.
enum class PoolKind : uint8_t { None, String, Int, UInt, Double, Multiname };

struct OpInfo {
    PoolKind pool;
    bool branch;      // operand 0 is a label name
    bool terminator;  // control never falls through
};

constexpr OpInfo get_op_info(Op op) {
    using enum Op;
    switch (op) {
        case PUSHSTRING: case DEBUGFILE:
            return {PoolKind::String, false, false};
        case PUSHINT:
            return {PoolKind::Int, false, false};
        case PUSHUINT:
            return {PoolKind::UInt, false, false};
        case PUSHDOUBLE:
            return {PoolKind::Double, false, false};

        case GETSUPER: case SETSUPER: case CALLSUPER: case CALLPROPERTY: case CONSTRUCTPROP:
        case CALLPROPLEX: case CALLSUPERVOID: case CALLPROPVOID: case GETDESCENDANTS:
        case FINDPROPSTRICT: case FINDPROPERTY: case GETLEX: case SETPROPERTY:
        case GETPROPERTY: case INITPROPERTY: case DELETEPROPERTY:
        case COERCE: case ASTYPE: case ISTYPE:
            return {PoolKind::Multiname, false, false};

        case JUMP:
            return {PoolKind::None, true, true};
        case IFNLT: case IFNLE: case IFNGT: case IFNGE: case IFTRUE: case IFFALSE:
        case IFEQ: case IFNE: case IFLT: case IFLE: case IFGT: case IFGE:
        case IFSTRICTEQ: case IFSTRICTNE:
            return {PoolKind::None, true, false};

        case THROW: case RETURNVOID: case RETURNVALUE:
            return {PoolKind::None, false, true};

        default:
            return {PoolKind::None, false, false};
    }
}

[[nodiscard]] constexpr bool is_pseudo(Op op) {
    return op == Op::BEGINTRY || op == Op::ENDTRY || op == Op::ADDEXCINFO || op == Op::BEGINCATCH;
}

} // namespace fusion::avm2

template <>
struct meow::enum_traits<fusion::avm2::Op> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 255;
};
