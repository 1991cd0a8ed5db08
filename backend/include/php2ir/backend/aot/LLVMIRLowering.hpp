// backend/include/php2ir/backend/aot/LLVMIRLowering.hpp
#pragma once

#include <php2ir/backend/Backend.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace php2ir::backend::aot {

    /// @brief LIR -> LLVM-IR 텍스트 lowering 옵션.
    struct LLVMIRLoweringOptions {
        // < 15: typed pointers (i8*), otherwise opaque `ptr`
        uint32_t llvm_lane_major = 14;
    };

    /// @brief LIR -> LLVM-IR 텍스트 lowering 결과.
    struct LLVMIRLoweringResult {
        bool ok = false;
        std::string llvm_ir{};
        std::vector<CompileMessage> messages{};
    };

    /// @brief LLVM API 기반 검증/최적화/object emission 옵션.
    struct LLVMObjectEmissionOptions {
        std::string target_triple{};
        std::string cpu{};
        uint8_t opt_level = 0;
    };

    /// @brief LLVM API 기반 object emission 결과.
    struct LLVMObjectEmissionResult {
        bool ok = false;
        std::vector<CompileMessage> messages{};
    };

    /// @brief LIR 모듈을 LLVM-IR(text)로 낮춘다. 클래스 디스크립터와 main 래퍼도 여기서 만든다.
    LLVMIRLoweringResult lower_lir_to_llvm_ir_text(
        const php2ir::lir::Module& m,
        const LLVMIRLoweringOptions& opt
    );

    /// @brief LLVM-IR 텍스트를 파싱하고 llvm::verifyModule로 검증만 한다.
    LLVMObjectEmissionResult verify_llvm_ir_text(std::string_view llvm_ir_text);

    /// @brief LLVM-IR 텍스트를 LLVM API로 object(.o)로 방출한다. opt_level > 0이면 IR 최적화를 먼저 돈다.
    LLVMObjectEmissionResult emit_object_from_llvm_ir_text(
        std::string_view llvm_ir_text,
        const std::string& output_path,
        const LLVMObjectEmissionOptions& opt
    );

    /// @brief 현재 빌드가 LLVM 툴체인과 링크되었는지.
    bool llvm_toolchain_available();

} // namespace php2ir::backend::aot
