// frontend/include/php2ir/rt/RuntimeABI.hpp
#pragma once
#include <php2ir/lir/Type.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace php2ir::rt {

    // ---- ownership convention ----
    //
    // 핸들을 돌려주는 함수는 항상 새 참조(+1)를 넘긴다.
    // 매개변수는 consumes 비트가 켜져 있으면 참조 하나를 가져가고, 아니면 빌려 쓴다.
    // 예외를 던지는 함수도 consumes 규칙은 똑같이 지킨다.
    // null box(nullptr)에 대한 retain/release는 아무 일도 하지 않는다.

    enum class RtFn : uint16_t {
        // lifecycle / exceptions
        kInit,
        kShutdown,
        kRetain,
        kRelease,
        kRaise,
        kExcPending,
        kExcTake,
        kReportUncaught,

        // strings
        kStrLiteral,
        kStrConcat,
        kStrEq,
        kStrCmp,
        kStrLen,
        kStrAt,
        kStrRepeat,
        kStrUpper,
        kImplode,
        kStrFromInt,
        kStrFromFloat,
        kStrFromBool,
        kStrToInt,
        kStrToFloat,
        kStrToBool,
        kEcho,

        // boxes
        kBoxInt,
        kBoxFloat,
        kBoxBool,
        kBoxStr,
        kBoxArr,
        kBoxObj,
        kUnboxInt,
        kUnboxFloat,
        kUnboxBool,
        kUnboxStr,
        kUnboxArr,
        kUnboxObj,
        kBoxIdentical,
        kBoxLooseEq,
        kBoxCmp,
        kBoxAdd,
        kBoxSub,
        kBoxMul,
        kBoxDiv,
        kBoxPow,
        kBoxNeg,
        kBoxInstanceOf,

        // arrays (copy-on-write)
        kArrNew,
        kArrGet,
        kArrGetInt,
        kArrSet,
        kArrSetInt,
        kArrPush,
        kArrCount,
        kArrKeyAt,
        kArrValueAt,
        kArrIdentical,

        // objects
        kObjNew,
        kObjInstanceOf,
        kPropGetDyn,
        kPropSetDyn,
        kCallDyn,

        // math
        kIPow,
        kFPow,
        kAbsInt,
        kAbsFloat,
        kSqrt,
        kSin,
        kCos,
        kFloor,

        kCount_,
    };

    struct RtFnInfo {
        RtFn id = RtFn::kInit;
        std::string_view symbol{};          // php2ir_rt_*
        lir::Type ret = lir::Type::kVoid;
        std::vector<lir::Type> params{};
        uint32_t consumes = 0;              // bit i: parameter i is consumed
        bool may_throw = false;
    };

    const RtFnInfo& rt_info(RtFn f);
    const std::vector<RtFnInfo>& rt_table();

    inline bool consumes_param(const RtFnInfo& info, uint32_t i) {
        return (info.consumes >> i) & 1u;
    }

    // ---- heap layouts ----
    //
    // object  : { i64 rc, ptr class, slot[0..n) }   slot은 8바이트, 타입은 class의 slot_kinds
    // class   : { ptr name, ptr parent, i64 slot_count, ptr slot_kinds, ptr slot_names,
    //             ptr slot_public, ptr vtable, i64 vtable_len, ptr methods, i64 method_count,
    //             ptr interfaces, i64 interface_count, i64 is_interface }
    // method  : { ptr name, ptr adapter, i64 arity, i64 required }
    //           adapter(obj this, arr args) -> box, 인자는 box로 받아 선언 타입으로 강제 변환한다.

    inline constexpr uint32_t kObjHeaderBytes = 16;
    inline constexpr uint32_t kSlotBytes = 8;
    inline constexpr uint32_t kClassDescFields = 13;

    /// @brief slot_kinds 배열의 값. 런타임은 이것으로 box 변환과 해제를 정한다.
    enum class SlotKind : uint8_t {
        kBool = 1,
        kInt = 2,
        kFloat = 3,
        kStr = 4,
        kArr = 5,
        kObj = 6,
        kBox = 7,
    };
    SlotKind slot_kind(lir::Type t);

    // ---- configuration ----

    enum class GcMode : uint8_t { kRefCount };
    enum class HashPolicy : uint8_t { kRobinHood = 0, kLinear = 1 };

    /// @brief php2ir_rt_init(sso_threshold, initial_capacity, hash_policy)로 넘어간다.
    struct RuntimeConfig {
        GcMode gc = GcMode::kRefCount;
        uint32_t sso_threshold = 23;
        HashPolicy hash = HashPolicy::kRobinHood;
        uint32_t initial_array_capacity = 8;
    };

    /// @brief 정수 종료 코드. 잡히지 않은 예외로 끝나면 main 래퍼가 돌려준다.
    inline constexpr int kUncaughtExitCode = 255;

    // ---- symbol mangling ----

    std::string sanitize(std::string_view s);
    std::string mangle_function(std::string_view name);
    std::string mangle_method(std::string_view cls, std::string_view method);
    std::string mangle_adapter(std::string_view cls, std::string_view method);
    std::string mangle_class(std::string_view cls);
    std::string mangle_main(std::string_view unit);

    /// @brief float -> string 변환 형식(%.14G, PHP precision=14).
    std::string format_float(double v);

} // namespace php2ir::rt
