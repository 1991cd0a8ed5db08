// frontend/include/php2ir/ssa/Dominance.hpp
#pragma once
#include <php2ir/cfg/CFG.hpp>

#include <cstdint>
#include <vector>


namespace php2ir::ssa {

    /// @brief 블록 인덱스 기준 지배 정보.
    /// idom은 Cooper-Harvey-Kennedy 반복법으로 구하고, 지배 질의는 dom tree의 pre/post 번호로 답한다.
    struct DomInfo {
        cfg::BlockId entry = 0;
        std::vector<std::vector<cfg::BlockId>> preds_by_block{};
        std::vector<std::vector<cfg::BlockId>> succs_by_block{};

        std::vector<uint32_t> rpo{};                     // reachable blocks in reverse postorder
        std::vector<int32_t> idom{};                     // -1: entry or unreachable
        std::vector<uint32_t> tree_pre{};                // dom tree preorder number, 0: unreachable
        std::vector<uint32_t> tree_post{};
        std::vector<std::vector<uint32_t>> dom_tree{};   // idom -> children
        std::vector<std::vector<uint32_t>> df{};         // dominance frontier
    };

    DomInfo build_dom_info(std::vector<std::vector<cfg::BlockId>> preds,
                           std::vector<std::vector<cfg::BlockId>> succs, cfg::BlockId entry);
    DomInfo build_dom_info(const cfg::Function& f);

    /// @brief a가 b를 지배하는지(반사적).
    bool dominates(const DomInfo& dom, cfg::BlockId a, cfg::BlockId b);

} // namespace php2ir::ssa
