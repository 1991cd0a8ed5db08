// backend/include/php2ir/backend/aot/AOTBackend.hpp
#pragma once
#include <php2ir/backend/Backend.hpp>


namespace php2ir::backend::aot {

    /// @brief LLVM 기반 AOT 백엔드.
    class AOTBackend final : public php2ir::backend::Backend {
    public:
        BackendKind kind() const override;

        /// @brief LIR -> LLVM-IR 텍스트 -> 파싱/검증 -> (최적화) -> .o
        CompileResult compile(const php2ir::lir::Module& m, const CompileOptions& opt) override;
    };

} // namespace php2ir::backend::aot
