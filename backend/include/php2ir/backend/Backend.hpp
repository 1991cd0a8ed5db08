// backend/include/php2ir/backend/Backend.hpp
#pragma once

#include <php2ir/lir/LIR.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace php2ir::backend {

    /// @brief 백엔드 종류 식별자.
    enum class BackendKind : uint8_t {
        kAot,
    };

    /// @brief 백엔드 컴파일 옵션.
    struct CompileOptions {
        uint8_t opt_level = 0;
        std::string target_triple{};        // empty: host
        std::string cpu{};

        std::string output_path{};
        bool emit_llvm_ir = false;          // write the .ll text to output_path
        bool emit_object = false;           // write an object file to output_path
    };

    /// @brief 백엔드 메시지(오류/정보).
    struct CompileMessage {
        bool is_error = false;
        std::string text{};
    };

    /// @brief 백엔드 실행 결과.
    struct CompileResult {
        bool ok = false;
        std::string llvm_ir{};
        std::vector<CompileMessage> messages{};
    };

    /// @brief LIR 모듈을 타깃 산출물로 바꾸는 백엔드 공통 인터페이스.
    class Backend {
    public:
        virtual ~Backend() = default;

        virtual BackendKind kind() const = 0;

        /// @brief LIR 모듈 하나를 받아 LLVM-IR 텍스트와 (요청 시) .ll/.o 파일을 만든다.
        virtual CompileResult compile(const php2ir::lir::Module& m, const CompileOptions& opt) = 0;
    };

} // namespace php2ir::backend
