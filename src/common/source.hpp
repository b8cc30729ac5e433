#pragma once

#include "span.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace errtree {

/// 行・列の索引インターフェース（レンダラーが使用する）
class Indexer {
   public:
    virtual ~Indexer() = default;

    /// オフセットから行・列（0始まり）を取得
    virtual LineColumn line_col_at(size_t pos) const = 0;

    /// posを含む行の開始・終了（改行を含む）
    virtual ByteRange line_span_at(size_t pos) const = 0;

    /// start..endを前後の文脈行で広げた範囲（文書の端でクランプ）
    virtual ByteRange span_with_context_lines(size_t start, size_t end, size_t before,
                                              size_t after) const = 0;
};

/// 各行の終了位置（改行の直後）を保持するIndexer
///
/// テキスト末尾には暗黙の改行があるものとして扱う。
class LineIndexer : public Indexer {
   public:
    explicit LineIndexer(std::string_view text);

    LineColumn line_col_at(size_t pos) const override;
    ByteRange line_span_at(size_t pos) const override;
    ByteRange span_with_context_lines(size_t start, size_t end, size_t before,
                                      size_t after) const override;

    /// 行数（暗黙の最終行を含む）
    size_t line_count() const { return line_ends_.size(); }

    /// 指定行（0始まり）の開始オフセット
    size_t line_start(size_t line) const { return line == 0 ? 0 : line_ends_[line - 1]; }

   private:
    // 二分探索の結果 (found, index)
    std::pair<bool, size_t> search(size_t pos) const;
    size_t line_start_at(size_t pos) const;
    size_t line_at(size_t pos) const;

    std::vector<size_t> line_ends_;
};

/// ソースファイル（不変、共有される）
class SourceFile {
   public:
    SourceFile(std::string uri, std::string text)
        : uri_(std::move(uri)), text_(std::move(text)), indexer_(text_) {}

    const std::string& uri() const { return uri_; }
    const std::string& text() const { return text_; }
    const LineIndexer& indexer() const { return indexer_; }

    /// Spanから文字列を取得
    std::string_view get_text(Span span) const;

    /// 指定行（0始まり）の内容を改行なしで取得
    std::string_view get_line(size_t line) const;

   private:
    std::string uri_;
    std::string text_;
    LineIndexer indexer_;
};

/// 共有SourceFile上のバイト範囲
///
/// デフォルト構築したものは「位置不明」を表す。
class SourceSpan {
   public:
    SourceSpan() = default;
    SourceSpan(std::shared_ptr<const SourceFile> file, size_t start, size_t end)
        : file_(std::move(file)), start_(start), end_(end) {}

    size_t start() const { return start_; }
    size_t end() const { return end_; }
    const std::string& uri() const;
    const std::string& source_text() const;
    const Indexer& source_index() const;

    bool is_known() const { return file_ != nullptr; }
    const std::shared_ptr<const SourceFile>& file() const { return file_; }

   private:
    std::shared_ptr<const SourceFile> file_;
    size_t start_ = 0;
    size_t end_ = 0;
};

}  // namespace errtree
