#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace errtree {

/// ソースコード内の位置情報
struct Span {
    uint32_t start;  // 開始オフセット（バイト）
    uint32_t end;    // 終了オフセット（バイト）

    static Span empty() { return Span{0, 0}; }

    Span merge(const Span& other) const {
        return Span{std::min(start, other.start), std::max(end, other.end)};
    }

    uint32_t length() const { return end - start; }
    bool is_empty() const { return start == end; }

    bool operator==(const Span& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

/// 行・列情報（0始まり）
struct LineColumn {
    size_t line;
    size_t column;

    bool operator==(const LineColumn& other) const {
        return line == other.line && column == other.column;
    }
};

/// バイト範囲（Indexerの戻り値）
struct ByteRange {
    size_t start;
    size_t end;

    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
};

}  // namespace errtree
