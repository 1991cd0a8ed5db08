// backend/src/aot/AOTBackend.cpp
#include <php2ir/backend/aot/AOTBackend.hpp>
#include <php2ir/backend/aot/LLVMIRLowering.hpp>

#include <fstream>

#ifndef PHP2IR_LLVM_TOOLCHAIN_FOUND
#define PHP2IR_LLVM_TOOLCHAIN_FOUND 0
#endif

#if PHP2IR_LLVM_TOOLCHAIN_FOUND
#include <llvm/Config/llvm-config.h>
#endif

namespace php2ir::backend::aot {

    namespace {

        uint32_t llvm_lane_major_() {
#if PHP2IR_LLVM_TOOLCHAIN_FOUND
            return LLVM_VERSION_MAJOR;
#else
            return 14;
#endif
        }

        void append_(CompileResult& r, std::vector<CompileMessage>& msgs) {
            for (auto& m : msgs) r.messages.push_back(std::move(m));
            msgs.clear();
        }

    } // namespace

    BackendKind AOTBackend::kind() const {
        return BackendKind::kAot;
    }

    /// @brief LIR -> LLVM-IR 텍스트, 요청에 따라 .ll 기록 / 검증 / object 방출.
    CompileResult AOTBackend::compile(const php2ir::lir::Module& m, const CompileOptions& opt) {
        CompileResult r{};

        LLVMIRLoweringOptions lo{};
        lo.llvm_lane_major = llvm_lane_major_();
        auto lowered = lower_lir_to_llvm_ir_text(m, lo);
        append_(r, lowered.messages);
        if (!lowered.ok) {
            r.ok = false;
            return r;
        }
        r.llvm_ir = std::move(lowered.llvm_ir);

        if (opt.emit_llvm_ir) {
            if (opt.output_path.empty()) {
                r.ok = false;
                r.messages.push_back(CompileMessage{true, "emit_llvm_ir requires an output path."});
                return r;
            }
            std::ofstream ofs(opt.output_path, std::ios::binary);
            if (!ofs) {
                r.ok = false;
                r.messages.push_back(CompileMessage{true, "failed to open output path '" + opt.output_path + "'."});
                return r;
            }
            ofs << r.llvm_ir;
            r.messages.push_back(CompileMessage{false, "wrote LLVM-IR to " + opt.output_path});
        }

        if (opt.emit_object) {
            if (opt.output_path.empty()) {
                r.ok = false;
                r.messages.push_back(CompileMessage{true, "emit_object requires an output path."});
                return r;
            }
            LLVMObjectEmissionOptions eo{};
            eo.target_triple = opt.target_triple;
            eo.cpu = opt.cpu;
            eo.opt_level = opt.opt_level;
            auto emitted = emit_object_from_llvm_ir_text(r.llvm_ir, opt.output_path, eo);
            append_(r, emitted.messages);
            r.ok = emitted.ok;
            return r;
        }

        // no object requested: still make sure LLVM accepts the text when it is linked in
        if (llvm_toolchain_available()) {
            auto verified = verify_llvm_ir_text(r.llvm_ir);
            append_(r, verified.messages);
            r.ok = verified.ok;
            return r;
        }

        r.ok = true;
        return r;
    }

} // namespace php2ir::backend::aot
