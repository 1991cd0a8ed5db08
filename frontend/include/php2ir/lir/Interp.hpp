// frontend/include/php2ir/lir/Interp.hpp
#pragma once
#include <php2ir/lir/LIR.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace php2ir::lir {

    struct InterpOptions {
        uint64_t step_limit = 50'000'000;
        uint32_t max_call_depth = 2000;
    };

    struct InterpResult {
        bool ok = false;                    // ran to the end (an uncaught exception still counts)
        std::string output{};               // everything echo wrote
        int exit_code = 0;

        bool uncaught = false;
        std::string uncaught_class{};
        std::string uncaught_message{};

        uint64_t leaked = 0;                // heap cells still alive after shutdown
        uint64_t allocations = 0;
        std::string error{};                // interpreter fault: bad IR, freed handle, step limit
    };

    /// @brief LIR 참조 인터프리터. 런타임 ABI를 흉내 낸 힙으로 C main 래퍼와 같은 순서를 밟는다:
    ///        init -> main_symbol -> 잡히지 않은 예외 보고 -> shutdown.
    ///        modules는 이름으로 서로 링크된다(prelude 모듈도 같이 넘겨야 한다).
    InterpResult run_program(const std::vector<const Module*>& modules, std::string_view main_symbol,
                             const InterpOptions& opt = {});

} // namespace php2ir::lir
