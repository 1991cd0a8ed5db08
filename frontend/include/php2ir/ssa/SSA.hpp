// frontend/include/php2ir/ssa/SSA.hpp
#pragma once
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/diag/Diagnostic.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace php2ir::ssa {

    using ValueId = uint32_t;
    using cfg::BlockId;

    inline constexpr ValueId kInvalidValue = 0xFFFF'FFFFu;
    /// @brief 어느 경로에서도 정의되지 않은 값. phi 입력에만 나타날 수 있다.
    inline constexpr ValueId kUndef = 0xFFFF'FFFEu;

    enum class DefKind : uint8_t {
        kParam,
        kOp,
        kPhi,
    };

    struct Value {
        cfg::Repr repr = cfg::Repr::kBox;
        ty::TypeId type = ty::kInvalidType;
        cfg::VarId var = cfg::kInvalidVar;  // source variable (diagnostics / dumps)
        DefKind def = DefKind::kOp;
        BlockId block = cfg::kInvalidBlock;
    };

    struct PhiIncoming {
        BlockId pred = cfg::kInvalidBlock;
        ValueId value = kUndef;
    };

    struct Phi {
        ValueId dst = kInvalidValue;
        cfg::VarId var = cfg::kInvalidVar;
        std::vector<PhiIncoming> incoming{};    // one entry per pred, same order as Block::preds
    };

    /// @brief cfg::Op를 그대로 쓰되 dst/a/b/c/args는 ValueId로 바뀐다.
    struct Block {
        std::vector<Phi> phis{};
        std::vector<cfg::Op> ops{};
        cfg::Term term{};
        std::vector<BlockId> preds{};
    };

    struct Function {
        std::string name{};
        resolve::SymbolId sym = resolve::kInvalidSymbol;
        resolve::SymbolId cls = resolve::kInvalidSymbol;
        bool is_main = false;

        ty::TypeId ret = ty::kInvalidType;
        cfg::Repr ret_repr = cfg::Repr::kVoid;

        std::vector<cfg::Var> vars{};       // carried over for names
        std::vector<Value> values{};
        std::vector<ValueId> params{};      // by parameter index

        std::vector<Block> blocks{};
        BlockId entry = 0;
        BlockId unwind_exit = cfg::kInvalidBlock;
        Span span{};
    };

    struct BuildStats {
        uint32_t phis_placed = 0;
        uint32_t phis_removed = 0;
        uint32_t copies_folded = 0;
        uint32_t values = 0;
    };

    struct BuildResult {
        bool ok = false;
        Function fn{};
        BuildStats stats{};
    };

    struct VerifyError {
        std::string msg;
    };

    /// @brief 정규 CFG 함수 하나를 SSA로 옮긴다.
    ///        정의 전에 읽을 수 있는 지역 변수는 kUseBeforeDef로 보고하고 ok=false.
    BuildResult build(const cfg::Function& f, diag::Bag& bag);

    struct Unit {
        std::string name{};
        bool ok = false;
        std::vector<Function> functions{};
        BuildStats stats{};
    };

    /// @brief 단위 안의 모든 함수를 SSA로 옮긴다. 하나라도 실패하면 ok=false.
    Unit build_unit(const cfg::Unit& u, diag::Bag& bag);

    /// @brief phi 개수 == pred 수, 정의가 사용을 지배하는지 확인한다.
    std::vector<VerifyError> verify(const Function& f);

    std::string dump(const Function& f);
    std::string dump(const Unit& u);

} // namespace php2ir::ssa
