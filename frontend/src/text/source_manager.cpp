// frontend/src/text/source_manager.cpp
#include <php2ir/text/SourceManager.hpp>

#include <algorithm>


namespace php2ir {

    std::vector<uint32_t> SourceManager::build_line_starts(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);
        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    // UTF-8 continuation bytes (10xxxxxx) do not start a column.
    uint32_t SourceManager::count_code_points(std::string_view s) {
        uint32_t n = 0;
        for (unsigned char c : s) {
            if ((c & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    uint32_t SourceManager::line_index_of(const File& f, uint32_t byte_off) {
        const auto& starts = f.line_starts;
        auto it = std::upper_bound(starts.begin(), starts.end(), byte_off);
        return (it == starts.begin()) ? 0 : static_cast<uint32_t>((it - starts.begin()) - 1);
    }

    const SourceManager::File* SourceManager::file_or_null(uint32_t file_id) const {
        if (file_id >= files_.size()) return nullptr;
        return &files_[file_id];
    }

    uint32_t SourceManager::add(std::string name, std::string content) {
        File f;
        f.name = std::move(name);
        f.content = std::move(content);
        f.line_starts = build_line_starts(f.content);
        files_.push_back(std::move(f));
        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        const File* f = file_or_null(file_id);
        return f ? std::string_view(f->name) : std::string_view("<unknown>");
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        const File* f = file_or_null(file_id);
        return f ? std::string_view(f->content) : std::string_view();
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        LineCol lc{};
        const File* f = file_or_null(file_id);
        if (f == nullptr) return lc;

        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(f->content.size()));
        const uint32_t idx = line_index_of(*f, off);
        const uint32_t start = f->line_starts[idx];

        lc.line = idx + 1;
        lc.col = count_code_points(std::string_view(f->content).substr(start, off - start)) + 1;
        return lc;
    }

    Snippet SourceManager::snippet_for_span(const Span& sp) const {
        Snippet sn{};
        const File* f = file_or_null(sp.file_id);
        if (f == nullptr) return sn;

        const uint32_t size = static_cast<uint32_t>(f->content.size());
        const uint32_t lo = std::min<uint32_t>(sp.lo, size);
        const uint32_t hi = std::max<uint32_t>(lo, std::min<uint32_t>(sp.hi, size));

        const uint32_t idx = line_index_of(*f, lo);
        const uint32_t line_start = f->line_starts[idx];
        const uint32_t line_end = (idx + 1 < f->line_starts.size())
            ? f->line_starts[idx + 1] - 1
            : size;

        const std::string_view text(f->content);
        sn.line_text = text.substr(line_start, line_end - line_start);
        sn.line_no = idx + 1;
        sn.caret_cols_before = count_code_points(text.substr(line_start, lo - line_start));
        sn.col = sn.caret_cols_before + 1;

        const uint32_t hi_clamped = std::min(hi, line_end);
        sn.caret_cols_len = count_code_points(text.substr(lo, hi_clamped - lo));
        if (sn.caret_cols_len == 0) sn.caret_cols_len = 1;
        return sn;
    }

} // namespace php2ir
