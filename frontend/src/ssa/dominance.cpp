// frontend/src/ssa/dominance.cpp
#include <php2ir/ssa/Dominance.hpp>

#include <algorithm>
#include <utility>


namespace php2ir::ssa {

    namespace {

        constexpr uint32_t k_no_rpo = UINT32_MAX;

        /// @brief entry에서 도달 가능한 블록의 reverse postorder. 재귀 없이 명시적 스택으로 돈다.
        std::vector<uint32_t> reverse_postorder_(const std::vector<std::vector<cfg::BlockId>>& succs, cfg::BlockId entry) {
            const uint32_t n = static_cast<uint32_t>(succs.size());
            std::vector<uint32_t> post;
            post.reserve(n);
            std::vector<uint8_t> seen(n, 0);
            std::vector<std::pair<uint32_t, uint32_t>> stack; // (block, next succ index)

            seen[entry] = 1;
            stack.emplace_back(entry, 0);
            while (!stack.empty()) {
                auto& [b, k] = stack.back();
                if (k < succs[b].size()) {
                    const uint32_t s = succs[b][k++];
                    if (s < n && !seen[s]) {
                        seen[s] = 1;
                        stack.emplace_back(s, 0);
                    }
                    continue;
                }
                post.push_back(b);
                stack.pop_back();
            }
            std::reverse(post.begin(), post.end());
            return post;
        }

        uint32_t intersect_(uint32_t a, uint32_t b, const std::vector<int32_t>& idom, const std::vector<uint32_t>& order) {
            while (a != b) {
                while (order[a] > order[b]) a = static_cast<uint32_t>(idom[a]);
                while (order[b] > order[a]) b = static_cast<uint32_t>(idom[b]);
            }
            return a;
        }

    } // namespace

    DomInfo build_dom_info(const cfg::Function& f) {
        std::vector<std::vector<cfg::BlockId>> preds(f.blocks.size());
        std::vector<std::vector<cfg::BlockId>> succs(f.blocks.size());
        for (cfg::BlockId b = 0; b < f.blocks.size(); ++b) {
            preds[b] = f.blocks[b].preds;
            succs[b] = cfg::successors(f.blocks[b].term);
        }
        return build_dom_info(std::move(preds), std::move(succs), f.entry);
    }

    DomInfo build_dom_info(std::vector<std::vector<cfg::BlockId>> preds,
                           std::vector<std::vector<cfg::BlockId>> succs, cfg::BlockId entry) {
        DomInfo info{};
        const uint32_t n = static_cast<uint32_t>(preds.size());
        info.entry = entry;
        info.preds_by_block = std::move(preds);
        info.succs_by_block = std::move(succs);
        if (n == 0 || entry >= n) return info;

        info.idom.assign(n, -1);
        info.dom_tree.assign(n, {});
        info.df.assign(n, {});
        info.tree_pre.assign(n, 0);
        info.tree_post.assign(n, 0);

        info.rpo = reverse_postorder_(info.succs_by_block, entry);
        std::vector<uint32_t> order(n, k_no_rpo);
        for (uint32_t i = 0; i < info.rpo.size(); ++i) order[info.rpo[i]] = i;

        // entry는 임시로 자기 자신을 idom으로 둔다. 끝나면 -1로 되돌린다.
        info.idom[entry] = static_cast<int32_t>(entry);
        bool changed = true;
        while (changed) {
            changed = false;
            for (uint32_t i = 1; i < info.rpo.size(); ++i) {
                const uint32_t b = info.rpo[i];
                int32_t nidom = -1;
                for (cfg::BlockId p : info.preds_by_block[b]) {
                    if (p >= n || order[p] == k_no_rpo || info.idom[p] < 0) continue;
                    nidom = (nidom < 0) ? static_cast<int32_t>(p)
                                        : static_cast<int32_t>(intersect_(p, static_cast<uint32_t>(nidom), info.idom, order));
                }
                if (nidom >= 0 && info.idom[b] != nidom) {
                    info.idom[b] = nidom;
                    changed = true;
                }
            }
        }
        info.idom[entry] = -1;

        for (uint32_t b : info.rpo) {
            if (info.idom[b] >= 0) info.dom_tree[static_cast<uint32_t>(info.idom[b])].push_back(b);
        }

        // dom tree pre/post 번호. 번호는 1부터 매겨 0을 "도달 불가"로 쓴다.
        {
            uint32_t clock = 0;
            std::vector<std::pair<uint32_t, uint32_t>> stack;
            info.tree_pre[entry] = ++clock;
            stack.emplace_back(entry, 0);
            while (!stack.empty()) {
                auto& [b, k] = stack.back();
                if (k < info.dom_tree[b].size()) {
                    const uint32_t c = info.dom_tree[b][k++];
                    info.tree_pre[c] = ++clock;
                    stack.emplace_back(c, 0);
                    continue;
                }
                info.tree_post[b] = ++clock;
                stack.pop_back();
            }
        }

        // DF: join 블록마다 각 pred에서 idom까지 올라간다.
        for (uint32_t b : info.rpo) {
            const auto& bp = info.preds_by_block[b];
            if (bp.size() < 2) continue;
            for (cfg::BlockId p : bp) {
                if (p >= n || order[p] == k_no_rpo) continue;
                int32_t runner = static_cast<int32_t>(p);
                while (runner >= 0 && runner != info.idom[b]) {
                    auto& dfr = info.df[static_cast<uint32_t>(runner)];
                    if (std::find(dfr.begin(), dfr.end(), b) == dfr.end()) dfr.push_back(b);
                    runner = info.idom[static_cast<uint32_t>(runner)];
                }
            }
        }
        return info;
    }

    bool dominates(const DomInfo& dom, cfg::BlockId a, cfg::BlockId b) {
        if (a >= dom.tree_pre.size() || b >= dom.tree_pre.size()) return false;
        if (a == b) return true;
        if (dom.tree_pre[a] == 0 || dom.tree_pre[b] == 0) return false;
        return dom.tree_pre[a] < dom.tree_pre[b] && dom.tree_post[b] < dom.tree_post[a];
    }

} // namespace php2ir::ssa
