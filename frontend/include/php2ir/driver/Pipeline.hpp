// frontend/include/php2ir/driver/Pipeline.hpp
#pragma once
#include <php2ir/ast/Nodes.hpp>
#include <php2ir/diag/Diagnostic.hpp>
#include <php2ir/lir/LIR.hpp>
#include <php2ir/lir/Lower.hpp>
#include <php2ir/lir/RefCount.hpp>
#include <php2ir/resolve/Resolve.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace php2ir::driver {

    struct PipelineOptions {
        uint32_t workers = 0;                               // 0: hardware_concurrency
        uint32_t max_errors = diag::Bag::kDefaultMaxErrors;
        bool verify = true;                                 // cfg / ssa / lir / rc gate after each stage
        resolve::ResolveOptions resolve{};
        rt::RuntimeConfig runtime{};

        // checked before each stage; a stage already running is never interrupted
        const std::atomic<bool>* cancel = nullptr;
    };

    /// @brief 컴파일할 단위 하나. unit은 빌린 것이고 compile_program이 끝날 때까지 살아 있어야 한다.
    struct UnitSource {
        const ast::Unit* unit = nullptr;
        std::vector<std::string> deps{};                    // unit names; the prelude is implicit
        bool entry = false;                                 // emits the C main wrapper
    };

    struct UnitResult {
        std::string name{};
        bool ok = false;
        bool entry = false;

        diag::Bag bag{};
        std::vector<std::string> internal_errors{};         // "stage: message"

        sema::ExportTablePtr exports{};
        lir::Module module{};

        lir::LowerStats lower_stats{};
        lir::RcStats rc_stats{};
    };

    struct PipelineResult {
        bool ok = false;
        std::vector<UnitResult> units{};                    // prelude first, then input order
        std::vector<std::string> internal_errors{};         // "unit: stage: message"
        std::string main_symbol{};                          // entry unit's __main, if any

        const UnitResult* find(std::string_view name) const;

        /// @brief 성공한 단위의 모듈 전부(인터프리터 / 링크 입력).
        std::vector<const lir::Module*> modules() const;
    };

    /// @brief 단위 하나를 resolve -> cfg -> ssa -> lower -> refcount 순서로 돌린다.
    ///        deps는 이미 해석된 의존 단위의 export table이다(prelude 포함).
    UnitResult compile_unit(const ast::Unit& unit, const std::vector<sema::ExportTablePtr>& deps,
                            bool entry, const PipelineOptions& opt = {});

    /// @brief 여러 단위를 의존 그래프의 위상 순서로 std::thread 워커에서 컴파일한다.
    ///        단위는 의존 단위의 해석이 끝나면 바로 시작한다.
    ///        prelude 단위는 항상 먼저 컴파일되고 모든 단위의 의존으로 붙는다.
    PipelineResult compile_program(const std::vector<UnitSource>& units, const PipelineOptions& opt = {});

} // namespace php2ir::driver
