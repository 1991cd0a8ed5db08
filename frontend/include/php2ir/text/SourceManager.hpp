// frontend/include/php2ir/text/SourceManager.hpp
#pragma once
#include <php2ir/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace php2ir {

    struct LineCol {
        uint32_t line = 1; // 1-based
        uint32_t col  = 1; // 1-based, counted in code points
    };

    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 1;
        uint32_t col = 1;
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
    };

    /// @brief 소스 버퍼 보관소. 진단 렌더링에서 span -> 줄/열 변환에 쓴다.
    class SourceManager {
    public:
        uint32_t add(std::string name, std::string content);

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;
        uint32_t file_count() const { return static_cast<uint32_t>(files_.size()); }

        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        // single-line snippet (the span is clamped to its first line)
        Snippet snippet_for_span(const Span& sp) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts; // includes 0
        };

        static std::vector<uint32_t> build_line_starts(std::string_view s);
        static uint32_t count_code_points(std::string_view s);
        static uint32_t line_index_of(const File& f, uint32_t byte_off);

        const File* file_or_null(uint32_t file_id) const;

        std::vector<File> files_;
    };

} // namespace php2ir
