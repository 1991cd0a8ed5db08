// frontend/include/php2ir/diag/Render.hpp
#pragma once
#include <php2ir/diag/Diagnostic.hpp>
#include <php2ir/text/SourceManager.hpp>

#include <string>
#include <string_view>


namespace php2ir::diag {

    std::string_view code_name(Code c);
    std::string_view kind_name(ErrorKind k);

    /// @brief 템플릿에 인자를 채운 메시지 본문만 만든다.
    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief "error[Code]: msg" + 위치 + 한 줄 스니펫.
    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

    /// @brief 스니펫 없이 "kind file:line:col: msg" 한 줄로 렌더링한다(스냅샷 테스트용).
    std::string render_brief(const Diagnostic& d, const SourceManager& sm);

} // namespace php2ir::diag
