// frontend/include/php2ir/diag/Diagnostic.hpp
#pragma once
#include <php2ir/text/Span.hpp>
#include <php2ir/diag/DiagCode.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace php2ir::diag {

    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span)
            : severity_(severity), code_(code), span_(span) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }
        void add_arg_int(int64_t v)      {  args_.emplace_back(std::to_string(v));  }

        Severity severity() const   {  return severity_;    }
        Code code() const           {  return code_;        }
        ErrorKind kind() const      {  return kind_of(code_);  }
        Span span() const           {  return span_;        }
        const std::vector<std::string>& args() const {  return args_;  }

    private:
        Severity severity_{Severity::kError};
        Code code_{Code::kInternalFailure};
        Span span_{};
        std::vector<std::string> args_;
    };

    /// @brief 번역 단위 하나의 진단 모음. 오류 수가 max_errors에 도달하면
    ///        kTooManyErrors 하나만 남기고 이후 오류는 버린다(경고는 계속 받는다).
    class Bag {
    public:
        static constexpr uint32_t kDefaultMaxErrors = 64;

        Bag() = default;
        explicit Bag(uint32_t max_errors) : max_errors_(max_errors) {}

        void add(Diagnostic d) {
            const bool is_err = d.severity() != Severity::kWarning;
            if (is_err && max_errors_ != 0 && error_count_ >= max_errors_) {
                if (!truncated_) {
                    truncated_ = true;
                    ++fatal_count_;
                    diags_.emplace_back(Severity::kFatal, Code::kTooManyErrors, d.span());
                }
                ++dropped_;
                return;
            }
            if (d.severity() == Severity::kError) ++error_count_;
            if (d.severity() == Severity::kFatal) ++fatal_count_;
            diags_.push_back(std::move(d));
        }

        // merges another bag (used when a stage collected into a local bag)
        void absorb(const Bag& other) {
            for (const auto& d : other.diags_) {
                if (d.code() == Code::kTooManyErrors) continue;
                add(d);
            }
        }

        bool has_error() const {
            return error_count_ != 0 || fatal_count_ != 0;
        }

        bool has_fatal() const {
            return fatal_count_ != 0;
        }

        bool has_code(Code c) const {
            for (const auto& d : diags_) {
                if (d.code() == c) return true;
            }
            return false;
        }

        uint32_t count_kind(ErrorKind k) const {
            uint32_t n = 0;
            for (const auto& d : diags_) {
                if (d.severity() != Severity::kWarning && d.kind() == k) ++n;
            }
            return n;
        }

        const std::vector<Diagnostic>& diags() const {  return diags_;  }

        uint32_t error_count() const {  return error_count_;  }
        uint32_t fatal_count() const {  return fatal_count_;  }
        uint32_t issue_count() const {  return error_count_ + fatal_count_;  }
        uint32_t dropped_count() const {  return dropped_;  }
        uint32_t max_errors() const {  return max_errors_;  }
        bool truncated() const {  return truncated_;  }

    private:
        std::vector<Diagnostic> diags_;
        uint32_t max_errors_ = kDefaultMaxErrors;
        uint32_t error_count_ = 0;
        uint32_t fatal_count_ = 0;
        uint32_t dropped_ = 0;
        bool truncated_ = false;
    };

} // namespace php2ir::diag
