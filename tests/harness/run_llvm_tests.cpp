#include <php2ir/ast/Builder.hpp>
#include <php2ir/backend/aot/AOTBackend.hpp>
#include <php2ir/backend/aot/LLVMIRLowering.hpp>
#include <php2ir/driver/Pipeline.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using namespace php2ir;
    using namespace php2ir::backend::aot;
    using ast::BinOp;
    using ast::CatchSpec;
    using ast::Visibility;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static void print_messages_(const std::vector<backend::CompileMessage>& msgs) {
        for (const auto& m : msgs) std::cerr << "    " << (m.is_error ? "error: " : "note: ") << m.text << "\n";
    }

    /// @brief 산술 함수, 클래스, try/catch를 모두 담은 단위 하나.
    static void build_app_(ast::Unit& u) {
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("modulo", {b.param("a", "int"), b.param("b", "int")}, "int",
                                    {b.ret(b.bin(BinOp::kMod, b.var("a"), b.var("b")))})));
        b.emit(b.class_stmt(b.class_("Person", "", {b.property(Visibility::kPublic, "name", "string", b.str("ann"))}, {
            b.method(Visibility::kPublic, "greet", {}, "string",
                     {b.ret(b.bin(BinOp::kConcat, b.str("hi "), b.prop(b.this_(), "name")))}),
        })));
        b.emit(b.expr(b.assign(b.var("p"), b.new_("Person", {}))));
        b.emit(b.echo({b.mcall(b.var("p"), "greet", {}), b.str("\n")}));
        b.emit(b.try_({b.echo({b.call("modulo", {b.int_(10), b.int_(3)})})},
                      {CatchSpec{{"DivisionByZeroError"}, "e", {b.echo({b.mcall(b.var("e"), "getMessage", {})})}}}));
    }

    static driver::PipelineResult compile_app_(const ast::Unit& u) {
        driver::UnitSource src{};
        src.unit = &u;
        src.entry = true;
        return driver::compile_program({src});
    }

    static bool test_lowering_text_shape() {
        ast::Unit u{};
        build_app_(u);
        const auto pr = compile_app_(u);
        bool ok = require_(pr.ok, "program must compile");
        const driver::UnitResult* app = pr.find("app");
        if (!pr.ok || app == nullptr) return false;

        LLVMIRLoweringOptions lo{};
        lo.llvm_lane_major = 14;
        const auto lowered = lower_lir_to_llvm_ir_text(app->module, lo);
        if (!lowered.ok) print_messages_(lowered.messages);

        ok &= require_(lowered.ok, "lowering must succeed");
        ok &= require_(lowered.llvm_ir.find("define ") != std::string::npos, "functions are defined");
        ok &= require_(lowered.llvm_ir.find("srem") != std::string::npos, "modulo uses srem");
        ok &= require_(lowered.llvm_ir.find("@php_class_person") != std::string::npos, "class descriptor global");
        ok &= require_(lowered.llvm_ir.find("@php_main_app") != std::string::npos, "unit main is emitted");
        ok &= require_(lowered.llvm_ir.find("define i32 @main(") != std::string::npos, "entry unit gets a C main");
        return ok;
    }

    static bool test_every_module_verifies() {
        if (!llvm_toolchain_available()) {
            std::cout << "  (llvm not linked, skipped)\n";
            return true;
        }
        ast::Unit u{};
        build_app_(u);
        const auto pr = compile_app_(u);
        bool ok = require_(pr.ok, "program must compile");
        if (!pr.ok) return false;

        for (const lir::Module* m : pr.modules()) {
            LLVMIRLoweringOptions lo{};
            lo.llvm_lane_major = 14;
            const auto lowered = lower_lir_to_llvm_ir_text(*m, lo);
            ok &= require_(lowered.ok, "lowering must succeed");
            if (!lowered.ok) {
                print_messages_(lowered.messages);
                continue;
            }
            const auto verified = verify_llvm_ir_text(lowered.llvm_ir);
            if (!verified.ok) {
                std::cerr << "    module " << m->unit << "\n";
                print_messages_(verified.messages);
            }
            ok &= require_(verified.ok, "LLVM must accept the lowered module");
        }
        return ok;
    }

    static bool test_verifier_rejects_garbage() {
        if (!llvm_toolchain_available()) {
            std::cout << "  (llvm not linked, skipped)\n";
            return true;
        }
        const auto r = verify_llvm_ir_text("define i64 @f() {\nentry:\n  ret i32 0\n}\n");
        bool ok = true;
        ok &= require_(!r.ok, "mistyped ret must be rejected");
        ok &= require_(!r.messages.empty(), "a reason is given");
        return ok;
    }

    static bool test_aot_backend_emits_object() {
        if (!llvm_toolchain_available()) {
            std::cout << "  (llvm not linked, skipped)\n";
            return true;
        }
        ast::Unit u{};
        build_app_(u);
        const auto pr = compile_app_(u);
        bool ok = require_(pr.ok, "program must compile");
        const driver::UnitResult* app = pr.find("app");
        if (!pr.ok || app == nullptr) return false;

        const std::filesystem::path out = std::filesystem::temp_directory_path() / "php2ir_llvm_test_app.o";
        std::error_code ec;
        std::filesystem::remove(out, ec);

        AOTBackend be;
        backend::CompileOptions opt{};
        opt.emit_object = true;
        opt.output_path = out.string();
        opt.opt_level = 1;
        const auto r = be.compile(app->module, opt);
        if (!r.ok) print_messages_(r.messages);

        ok &= require_(be.kind() == backend::BackendKind::kAot, "backend kind");
        ok &= require_(r.ok, "object emission must succeed");
        ok &= require_(!r.llvm_ir.empty(), "result carries the IR text");
        ok &= require_(std::filesystem::exists(out) && std::filesystem::file_size(out) > 0, "object file is written");
        std::filesystem::remove(out, ec);
        return ok;
    }

    static bool test_aot_backend_requires_output_path() {
        ast::Unit u{};
        build_app_(u);
        const auto pr = compile_app_(u);
        const driver::UnitResult* app = pr.find("app");
        if (!pr.ok || app == nullptr) return require_(false, "program must compile");

        AOTBackend be;
        backend::CompileOptions opt{};
        opt.emit_object = true;
        const auto r = be.compile(app->module, opt);
        return require_(!r.ok, "object emission without a path fails");
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"lowering_text_shape", test_lowering_text_shape},
        {"every_module_verifies", test_every_module_verifies},
        {"verifier_rejects_garbage", test_verifier_rejects_garbage},
        {"aot_backend_emits_object", test_aot_backend_emits_object},
        {"aot_backend_requires_output_path", test_aot_backend_requires_output_path},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.fn();
        std::cout << (ok ? "  -> PASS\n" : "  -> FAIL\n");
        if (!ok) ++failed;
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "ALL LLVM TESTS PASSED\n";
    return 0;
}
