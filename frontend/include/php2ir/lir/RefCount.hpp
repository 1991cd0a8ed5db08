// frontend/include/php2ir/lir/RefCount.hpp
#pragma once
#include <php2ir/lir/LIR.hpp>

#include <vector>


namespace php2ir::lir {

    struct RcStats {
        uint32_t retains = 0;
        uint32_t releases = 0;
        uint32_t edge_releases = 0;     // inserted at the head of a successor
    };

    /// @brief 핸들 연산 하나가 피연산자를 어떻게 쓰는지.
    struct HandleUse {
        ValueId value = kInvalidValue;
        bool consumed = false;
    };

    /// @brief inst가 읽는 핸들 값들(consume / borrow 표시 포함). 순서는 args 순서.
    std::vector<HandleUse> handle_uses(const Function& f, const Inst& inst);

    /// @brief ExcCheck로 끝나는 블록에서 예외 간선 위에서는 무효인 값(마지막 호출의 dst).
    ValueId guarded_value(const Function& f, BlockId b);

    /// @brief liveness 기반으로 retain/release를 넣는다.
    ///        모든 핸들 생성 inst는 +1을 돌려주고, consume 사용/ret/raise/phi 간선은 참조를 가져간다.
    RcStats insert_refcounts(Function& f);
    RcStats insert_refcounts(Module& m);

    /// @brief 모든 경로에서 핸들 카운트가 맞는지 추상 실행으로 확인한다.
    ///        음수, 살아 있는 값의 재정의, 합류 지점 불일치, 함수 종료 시 남은 참조가 오류다.
    std::vector<VerifyError> check_refcounts(const Function& f);
    std::vector<VerifyError> check_refcounts(const Module& m);

} // namespace php2ir::lir
