// frontend/include/php2ir/lir/Lower.hpp
#pragma once
#include <php2ir/lir/LIR.hpp>
#include <php2ir/resolve/Resolve.hpp>
#include <php2ir/ssa/SSA.hpp>


namespace php2ir::lir {

    struct LowerOptions {
        // C main wrapper (init -> __main -> shutdown) for the program's entry unit
        bool emit_entry = false;
        rt::RuntimeConfig runtime{};
    };

    struct LowerStats {
        uint32_t functions = 0;
        uint32_t adapters = 0;
        uint32_t insts = 0;
        uint32_t rt_calls = 0;
        uint32_t virtual_calls = 0;
    };

    struct LowerResult {
        bool ok = false;
        Module module{};
        diag::Bag bag{};
        LowerStats stats{};
    };

    /// @brief SSA 단위 하나를 LIR 모듈로 내린다.
    ///        RC 연산은 넣지 않는다. 이어서 insert_refcounts / check_refcounts를 돌린다.
    LowerResult lower_unit(const ssa::Unit& unit, const resolve::ResolvedUnit& ru,
                           const ty::TypePool& types, const LowerOptions& opt = {});

} // namespace php2ir::lir
