// backend/src/aot/LLVMObjectEmission.cpp
#include <php2ir/backend/aot/LLVMIRLowering.hpp>

#include <memory>
#include <optional>
#include <string>

#ifndef PHP2IR_LLVM_TOOLCHAIN_FOUND
#define PHP2IR_LLVM_TOOLCHAIN_FOUND 0
#endif

#if PHP2IR_LLVM_TOOLCHAIN_FOUND
#include <llvm/AsmParser/Parser.h>
#include <llvm/Config/llvm-config.h>
#include <llvm/IR/LegacyPassManager.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/CodeGen.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/Target/TargetOptions.h>
#if LLVM_VERSION_MAJOR >= 17
#include <llvm/TargetParser/Host.h>
#else
#include <llvm/Support/Host.h>
#endif
#endif

#include <mutex>

namespace php2ir::backend::aot {

    namespace {

#if PHP2IR_LLVM_TOOLCHAIN_FOUND
#if LLVM_VERSION_MAJOR >= 18
        using CodeGenLevel = llvm::CodeGenOptLevel;
#else
        using CodeGenLevel = llvm::CodeGenOpt::Level;
#endif

        /// @brief O 레벨 숫자를 LLVM CodeGen 레벨로 변환한다.
        CodeGenLevel to_codegen_opt_level_(uint8_t opt_level) {
            switch (opt_level) {
                case 0: return CodeGenLevel::None;
                case 1: return CodeGenLevel::Less;
                case 2: return CodeGenLevel::Default;
                case 3: return CodeGenLevel::Aggressive;
                default: return CodeGenLevel::Default;
            }
        }

        llvm::OptimizationLevel to_ir_opt_level_(uint8_t opt_level) {
            switch (opt_level) {
                case 1: return llvm::OptimizationLevel::O1;
                case 2: return llvm::OptimizationLevel::O2;
                default: return llvm::OptimizationLevel::O3;
            }
        }

        /// @brief LLVM target 서브시스템을 1회 초기화한다.
        void init_llvm_targets_once_() {
            static std::once_flag once;
            std::call_once(once, [] {
                llvm::InitializeAllTargetInfos();
                llvm::InitializeAllTargets();
                llvm::InitializeAllTargetMCs();
                llvm::InitializeAllAsmParsers();
                llvm::InitializeAllAsmPrinters();
            });
        }

        /// @brief LLVM 파서/코드젠 오류를 문자열로 렌더링한다.
        std::string render_diag_(const llvm::SMDiagnostic& diag) {
            std::string s;
            llvm::raw_string_ostream os(s);
            diag.print("php2ir", os);
            os.flush();
            return s;
        }

        /// @brief 텍스트를 파싱하고 verifyModule까지 통과한 모듈만 돌려준다.
        std::unique_ptr<llvm::Module> parse_and_verify_(
            std::string_view llvm_ir_text,
            llvm::LLVMContext& context,
            std::vector<CompileMessage>& messages
        ) {
            llvm::SMDiagnostic smdiag;
            auto mem = llvm::MemoryBuffer::getMemBufferCopy(std::string(llvm_ir_text), "php2ir.lir.ll");
            auto module = llvm::parseAssembly(*mem, smdiag, context);
            if (!module) {
                messages.push_back(CompileMessage{
                    true,
                    "failed to parse lowered LLVM-IR: " + render_diag_(smdiag)
                });
                return nullptr;
            }

            std::string verr;
            llvm::raw_string_ostream vos(verr);
            if (llvm::verifyModule(*module, &vos)) {
                vos.flush();
                messages.push_back(CompileMessage{
                    true,
                    "lowered LLVM-IR failed verification: " + verr
                });
                return nullptr;
            }
            return module;
        }
#endif

    } // namespace

    bool llvm_toolchain_available() {
        return PHP2IR_LLVM_TOOLCHAIN_FOUND != 0;
    }

    LLVMObjectEmissionResult verify_llvm_ir_text(std::string_view llvm_ir_text) {
        LLVMObjectEmissionResult out{};
#if !PHP2IR_LLVM_TOOLCHAIN_FOUND
        (void)llvm_ir_text;
        out.ok = false;
        out.messages.push_back(CompileMessage{
            true,
            "LLVM toolchain is not available in this build. Verification requires LLVM linkage."
        });
        return out;
#else
        llvm::LLVMContext context;
        auto module = parse_and_verify_(llvm_ir_text, context, out.messages);
        out.ok = (module != nullptr);
        return out;
#endif
    }

    LLVMObjectEmissionResult emit_object_from_llvm_ir_text(
        std::string_view llvm_ir_text,
        const std::string& output_path,
        const LLVMObjectEmissionOptions& opt
    ) {
        LLVMObjectEmissionResult out{};

#if !PHP2IR_LLVM_TOOLCHAIN_FOUND
        (void)llvm_ir_text;
        (void)output_path;
        (void)opt;
        out.ok = false;
        out.messages.push_back(CompileMessage{
            true,
            "LLVM toolchain is not available in this build. Object emission requires LLVM linkage."
        });
        return out;
#else
        init_llvm_targets_once_();

        llvm::LLVMContext context;
        auto module = parse_and_verify_(llvm_ir_text, context, out.messages);
        if (!module) {
            out.ok = false;
            return out;
        }

        const std::string triple =
            opt.target_triple.empty() ? llvm::sys::getDefaultTargetTriple() : opt.target_triple;
        module->setTargetTriple(triple);

        std::string target_err;
        const llvm::Target* target = llvm::TargetRegistry::lookupTarget(triple, target_err);
        if (target == nullptr) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "failed to lookup LLVM target for triple '" + triple + "': " + target_err
            });
            return out;
        }

        llvm::TargetOptions target_opt{};
        const std::string cpu = opt.cpu.empty() ? "generic" : opt.cpu;
        const auto cg_level = to_codegen_opt_level_(opt.opt_level);
#if LLVM_VERSION_MAJOR >= 16
        std::optional<llvm::Reloc::Model> reloc_model = llvm::Reloc::PIC_;
        std::optional<llvm::CodeModel::Model> code_model{};
#else
        llvm::Optional<llvm::Reloc::Model> reloc_model = llvm::Reloc::PIC_;
        llvm::Optional<llvm::CodeModel::Model> code_model{};
#endif
        auto tm = std::unique_ptr<llvm::TargetMachine>(target->createTargetMachine(
            triple,
            cpu,
            "",
            target_opt,
            reloc_model,
            code_model,
            cg_level
        ));
        if (!tm) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "failed to create LLVM TargetMachine for triple '" + triple + "'."
            });
            return out;
        }

        module->setDataLayout(tm->createDataLayout());

        // IR 최적화: O0은 건너뛴다(buildPerModuleDefaultPipeline이 O0을 받지 않는다).
        if (opt.opt_level > 0) {
            llvm::LoopAnalysisManager lam;
            llvm::FunctionAnalysisManager fam;
            llvm::CGSCCAnalysisManager cgam;
            llvm::ModuleAnalysisManager mam;

            llvm::PassBuilder pb(tm.get());
            pb.registerModuleAnalyses(mam);
            pb.registerCGSCCAnalyses(cgam);
            pb.registerFunctionAnalyses(fam);
            pb.registerLoopAnalyses(lam);
            pb.crossRegisterProxies(lam, fam, cgam, mam);

            llvm::ModulePassManager mpm = pb.buildPerModuleDefaultPipeline(to_ir_opt_level_(opt.opt_level));
            mpm.run(*module, mam);
            out.messages.push_back(CompileMessage{
                false,
                "ran LLVM O" + std::to_string(opt.opt_level) + " pipeline."
            });
        }

        std::error_code ec;
        llvm::raw_fd_ostream obj_out(output_path, ec, llvm::sys::fs::OF_None);
        if (ec) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "failed to open output object path '" + output_path + "': " + ec.message()
            });
            return out;
        }

        llvm::legacy::PassManager pm;
#if LLVM_VERSION_MAJOR >= 18
        const auto file_type = llvm::CodeGenFileType::ObjectFile;
#else
        const auto file_type = llvm::CGFT_ObjectFile;
#endif
        if (tm->addPassesToEmitFile(pm, obj_out, nullptr, file_type)) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "LLVM target machine does not support object emission for triple '" + triple + "'."
            });
            return out;
        }

        pm.run(*module);
        obj_out.flush();

        out.ok = true;
        out.messages.push_back(CompileMessage{
            false,
            "wrote object file to " + output_path
        });
        return out;
#endif
    }

} // namespace php2ir::backend::aot
