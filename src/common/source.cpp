// ============================================================
// LineIndexer / SourceFile 実装
// ============================================================

#include "source.hpp"

#include <algorithm>

namespace errtree {

namespace {

const std::string& empty_string() {
    static const std::string empty;
    return empty;
}

const LineIndexer& empty_indexer() {
    static const LineIndexer indexer{std::string_view{}};
    return indexer;
}

}  // namespace

LineIndexer::LineIndexer(std::string_view text) {
    // 各行の終了位置を記録（\n, \r\n, \r を改行とみなす）
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            line_ends_.push_back(i + 1);
        } else if (text[i] == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            line_ends_.push_back(i + 1);
        }
    }
    line_ends_.push_back(text.size());
}

std::pair<bool, size_t> LineIndexer::search(size_t pos) const {
    auto it = std::lower_bound(line_ends_.begin(), line_ends_.end(), pos);
    size_t index = static_cast<size_t>(it - line_ends_.begin());
    return {it != line_ends_.end() && *it == pos, index};
}

size_t LineIndexer::line_start_at(size_t pos) const {
    auto [found, i] = search(pos);
    if (found) {
        return line_ends_[i];
    }
    return i == 0 ? 0 : line_ends_[i - 1];
}

size_t LineIndexer::line_at(size_t pos) const {
    auto [found, i] = search(pos);
    return found ? i + 1 : i;
}

LineColumn LineIndexer::line_col_at(size_t pos) const {
    auto [found, i] = search(pos);
    if (found) {
        return LineColumn{i + 1, pos - line_ends_[i]};
    }
    if (i == 0) {
        return LineColumn{0, pos};
    }
    return LineColumn{i, pos - line_ends_[i - 1]};
}

ByteRange LineIndexer::line_span_at(size_t pos) const {
    auto [found, i] = search(pos);
    const size_t n = line_ends_.size();
    if (found) {
        if (i + 1 == n) {
            return ByteRange{line_ends_[i], line_ends_[i]};
        }
        return ByteRange{line_ends_[i], line_ends_[i + 1]};
    }
    if (i == 0) {
        return ByteRange{0, line_ends_[0]};
    }
    if (i == n) {
        return ByteRange{line_ends_[n - 1], line_ends_[n - 1]};
    }
    return ByteRange{line_ends_[i - 1], line_ends_[i]};
}

ByteRange LineIndexer::span_with_context_lines(size_t start, size_t end, size_t before,
                                               size_t after) const {
    size_t from;
    if (before == 0) {
        from = line_start_at(start);
    } else {
        size_t line = line_at(start);
        line = line > before ? line - before : 0;
        from = line == 0 ? 0 : line_ends_[line - 1];
    }

    size_t to;
    if (after == 0) {
        to = line_span_at(end).end;
    } else {
        size_t line = std::min(line_at(end) + after, line_ends_.size() - 1);
        to = line_ends_[line];
    }
    return ByteRange{from, to};
}

std::string_view SourceFile::get_text(Span span) const {
    if (span.start >= text_.size()) {
        return {};
    }
    return std::string_view(text_).substr(span.start, span.length());
}

std::string_view SourceFile::get_line(size_t line) const {
    if (line >= indexer_.line_count()) {
        return {};
    }
    size_t start = indexer_.line_start(line);
    size_t end = indexer_.line_span_at(start).end;
    if (start >= text_.size()) {
        return {};
    }
    // 改行文字を除去
    while (end > start && (text_[end - 1] == '\n' || text_[end - 1] == '\r')) {
        --end;
    }
    return std::string_view(text_).substr(start, end - start);
}

const std::string& SourceSpan::uri() const {
    return file_ ? file_->uri() : empty_string();
}

const std::string& SourceSpan::source_text() const {
    return file_ ? file_->text() : empty_string();
}

const Indexer& SourceSpan::source_index() const {
    if (file_) {
        return file_->indexer();
    }
    return empty_indexer();
}

}  // namespace errtree
