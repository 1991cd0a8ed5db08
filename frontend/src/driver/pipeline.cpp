// frontend/src/driver/pipeline.cpp
#include <php2ir/driver/Pipeline.hpp>
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/resolve/Prelude.hpp>
#include <php2ir/ssa/SSA.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>


namespace php2ir::driver {

    namespace {

        using ResolvedHook = std::function<void(const sema::ExportTablePtr&)>;

        bool cancelled_(const PipelineOptions& opt) {
            return opt.cancel != nullptr && opt.cancel->load(std::memory_order_relaxed);
        }

        void report_(diag::Bag& bag, diag::Code code, std::string_view a0, std::string_view a1 = {}) {
            diag::Diagnostic d(diag::Severity::kError, code, Span{});
            d.add_arg(a0);
            if (!a1.empty()) d.add_arg(a1);
            bag.add(std::move(d));
        }

        /// @brief stage 이름을 붙여 VerifyError를 내부 오류 목록으로 옮긴다.
        template <typename E>
        void gate_(UnitResult& r, std::string_view stage, std::string_view where, const std::vector<E>& errs) {
            for (const auto& e : errs) {
                std::string s(stage);
                s += ": ";
                if (!where.empty()) {
                    s += where;
                    s += ": ";
                }
                s += e.msg;
                r.internal_errors.push_back(std::move(s));
            }
        }

        UnitResult run_unit_(const ast::Unit& unit, const std::vector<sema::ExportTablePtr>& deps, bool entry,
                             const PipelineOptions& opt, const ResolvedHook& on_resolved) {
            UnitResult r{};
            r.name = unit.name;
            r.entry = entry;
            r.bag = diag::Bag(opt.max_errors);

            // dependents wait on this exactly once, whatever happens below
            bool hooked = false;
            auto publish = [&](const sema::ExportTablePtr& ex) {
                if (hooked) return;
                hooked = true;
                if (on_resolved) on_resolved(ex);
            };
            auto cancel_at = [&](std::string_view stage) {
                if (!cancelled_(opt)) return false;
                report_(r.bag, diag::Code::kCancelled, stage);
                publish(r.exports);
                return true;
            };

            // ---- resolve ----
            if (cancel_at("resolve")) return r;
            resolve::UnitInput in{};
            for (const auto& d : deps) {
                if (d) in.deps.push_back(d);
            }
            resolve::ResolvedUnit ru = resolve::resolve_unit(unit, in, r.bag, opt.resolve);
            r.exports = ru.exports;
            publish(r.exports);
            if (!ru.ok || r.bag.has_error()) return r;

            // ---- normalize ----
            if (cancel_at("normalize")) return r;
            const cfg::Unit cu = cfg::normalize_unit(unit.ast, ru, ru.types, r.bag);
            if (r.bag.has_error()) return r;
            if (opt.verify) {
                for (const auto& f : cu.functions) gate_(r, "cfg", f.name, cfg::verify(f));
                if (!r.internal_errors.empty()) return r;
            }

            // ---- ssa ----
            if (cancel_at("ssa")) return r;
            const ssa::Unit su = ssa::build_unit(cu, r.bag);
            if (!su.ok || r.bag.has_error()) return r;
            if (opt.verify) {
                for (const auto& f : su.functions) gate_(r, "ssa", f.name, ssa::verify(f));
                if (!r.internal_errors.empty()) return r;
            }

            // ---- lower ----
            if (cancel_at("lower")) return r;
            lir::LowerOptions lo{};
            lo.emit_entry = entry;
            lo.runtime = opt.runtime;
            lir::LowerResult lr = lir::lower_unit(su, ru, ru.types, lo);
            r.bag.absorb(lr.bag);
            r.lower_stats = lr.stats;
            if (!lr.ok) {
                // lowering only fails on broken invariants
                for (const auto& d : lr.bag.diags()) {
                    if (d.code() != diag::Code::kInternalFailure) continue;
                    std::string s = "lower: ";
                    for (size_t i = 0; i < d.args().size(); ++i) {
                        if (i) s += ": ";
                        s += d.args()[i];
                    }
                    r.internal_errors.push_back(std::move(s));
                }
                if (r.internal_errors.empty()) r.internal_errors.push_back("lower: failed without a reason");
                return r;
            }
            if (opt.verify) {
                gate_(r, "lir", "", lir::verify(lr.module));
                if (!r.internal_errors.empty()) return r;
            }

            // ---- refcount ----
            if (cancel_at("refcount")) return r;
            r.rc_stats = lir::insert_refcounts(lr.module);
            if (opt.verify) {
                gate_(r, "rc", "", lir::check_refcounts(lr.module));
                gate_(r, "lir", "after rc", lir::verify(lr.module));
                if (!r.internal_errors.empty()) return r;
            }

            r.module = std::move(lr.module);
            r.ok = !r.bag.has_error();
            return r;
        }

    } // namespace

    // ---- PipelineResult ----

    const UnitResult* PipelineResult::find(std::string_view name) const {
        for (const auto& u : units) {
            if (u.name == name) return &u;
        }
        return nullptr;
    }

    std::vector<const lir::Module*> PipelineResult::modules() const {
        std::vector<const lir::Module*> out;
        for (const auto& u : units) {
            if (u.ok) out.push_back(&u.module);
        }
        return out;
    }

    // ---- single unit ----

    UnitResult compile_unit(const ast::Unit& unit, const std::vector<sema::ExportTablePtr>& deps,
                            bool entry, const PipelineOptions& opt) {
        return run_unit_(unit, deps, entry, opt, ResolvedHook{});
    }

    // ---- program ----

    PipelineResult compile_program(const std::vector<UnitSource>& units, const PipelineOptions& opt) {
        PipelineResult out{};

        const ast::Unit prelude = resolve::build_prelude_unit();
        out.units.push_back(compile_unit(prelude, {}, false, opt));
        const sema::ExportTablePtr prelude_ex = out.units.front().exports;

        const size_t n = units.size();
        out.units.resize(n + 1);

        std::unordered_map<std::string, size_t> by_name;
        for (size_t i = 0; i < n; ++i) {
            UnitResult& r = out.units[i + 1];
            r.name = (units[i].unit != nullptr) ? units[i].unit->name : std::string{};
            r.entry = units[i].entry;
            r.bag = diag::Bag(opt.max_errors);
            by_name.emplace(r.name, i);
        }

        // ---- dependency graph ----
        std::vector<std::vector<size_t>> deps(n), dependents(n);
        std::vector<bool> skip(n, false);
        for (size_t i = 0; i < n; ++i) {
            UnitResult& r = out.units[i + 1];
            if (units[i].unit == nullptr) {
                report_(r.bag, diag::Code::kInternalFailure, "driver", "unit source without a syntax tree");
                skip[i] = true;
                continue;
            }
            for (const auto& d : units[i].deps) {
                if (d == resolve::k_prelude_unit_name) continue;
                auto it = by_name.find(d);
                if (it == by_name.end()) {
                    report_(r.bag, diag::Code::kUnknownDependency, d);
                    skip[i] = true;
                    continue;
                }
                if (std::find(deps[i].begin(), deps[i].end(), it->second) != deps[i].end()) continue;
                deps[i].push_back(it->second);
                dependents[it->second].push_back(i);
            }
        }

        // Kahn over the whole graph first: whatever never gets ordered sits on a cycle
        // or behind one, and is reported instead of scheduled
        {
            std::vector<size_t> indeg(n, 0);
            for (size_t i = 0; i < n; ++i) indeg[i] = deps[i].size();
            std::deque<size_t> q;
            for (size_t i = 0; i < n; ++i) {
                if (indeg[i] == 0) q.push_back(i);
            }
            std::vector<bool> ordered(n, false);
            while (!q.empty()) {
                const size_t u = q.front();
                q.pop_front();
                ordered[u] = true;
                for (size_t v : dependents[u]) {
                    if (--indeg[v] == 0) q.push_back(v);
                }
            }
            for (size_t i = 0; i < n; ++i) {
                if (ordered[i]) continue;
                report_(out.units[i + 1].bag, diag::Code::kDependencyCycle, out.units[i + 1].name);
                skip[i] = true;
            }
        }

        // ---- scheduling ----
        std::mutex mu;
        std::condition_variable cv;
        std::deque<size_t> ready;
        std::vector<size_t> waiting(n, 0);
        std::vector<sema::ExportTablePtr> exports(n);
        size_t pending = 0;

        // caller holds mu
        std::function<void(size_t, const sema::ExportTablePtr&)> resolved_locked =
            [&](size_t u, const sema::ExportTablePtr& ex) {
                exports[u] = ex;
                for (size_t v : dependents[u]) {
                    if (--waiting[v] == 0) {
                        if (skip[v]) {
                            // an unknown dependency elsewhere: resolved as "nothing exported"
                            resolved_locked(v, nullptr);
                        } else {
                            ready.push_back(v);
                        }
                    }
                }
            };

        {
            std::lock_guard<std::mutex> lk(mu);
            for (size_t i = 0; i < n; ++i) {
                waiting[i] = deps[i].size();
                if (!skip[i]) ++pending;
            }
            for (size_t i = 0; i < n; ++i) {
                if (waiting[i] != 0) continue;
                if (skip[i]) resolved_locked(i, nullptr);
                else ready.push_back(i);
            }
        }
        // cycle members never reach waiting == 0; they were counted out of pending above

        auto worker = [&]() {
            while (true) {
                size_t u = 0;
                {
                    std::unique_lock<std::mutex> lk(mu);
                    cv.wait(lk, [&] { return !ready.empty() || pending == 0; });
                    if (ready.empty()) return;
                    u = ready.front();
                    ready.pop_front();
                }

                std::vector<sema::ExportTablePtr> dep_ex;
                dep_ex.push_back(prelude_ex);
                {
                    std::lock_guard<std::mutex> lk(mu);
                    for (size_t d : deps[u]) dep_ex.push_back(exports[d]);
                }

                UnitResult r = run_unit_(*units[u].unit, dep_ex, units[u].entry, opt,
                                         [&](const sema::ExportTablePtr& ex) {
                                             std::lock_guard<std::mutex> lk(mu);
                                             resolved_locked(u, ex);
                                             cv.notify_all();
                                         });

                std::lock_guard<std::mutex> lk(mu);
                out.units[u + 1] = std::move(r);
                --pending;
                cv.notify_all();
            }
        };

        uint32_t workers = opt.workers;
        if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
        workers = static_cast<uint32_t>(std::min<size_t>(workers, std::max<size_t>(n, 1)));

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (uint32_t i = 0; i < workers; ++i) pool.emplace_back(worker);
        for (auto& t : pool) t.join();

        // ---- collect ----
        out.ok = true;
        for (const auto& u : out.units) {
            for (const auto& e : u.internal_errors) out.internal_errors.push_back(u.name + ": " + e);
            if (!u.ok) out.ok = false;
            if (u.entry && u.ok) out.main_symbol = u.module.main_symbol;
        }
        return out;
    }

} // namespace php2ir::driver
