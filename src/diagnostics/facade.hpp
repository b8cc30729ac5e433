#pragma once

// ============================================================
// 診断ファサード - 実行時のエラー値が満たすインターフェース
// ============================================================

#include "common/source.hpp"
#include "levels.hpp"

#include <string>

namespace errtree {
namespace diagnostics {

/// レンダラーが参照するエラー値の抽象インターフェース
class DiagnosticFacade {
   public:
    virtual ~DiagnosticFacade() = default;

    virtual Severity kind() const = 0;

    /// 数値コード（"01" など、先頭の0を保持）
    virtual std::string numeric_code() const = 0;

    /// 表示用コード（"E01" など）
    virtual std::string code() const = 0;

    /// 主要な位置（不明ならデフォルト構築のSourceSpan）
    virtual SourceSpan primary_span() const = 0;

    virtual std::string primary_message() const = 0;
    virtual std::string primary_label() const = 0;
};

}  // namespace diagnostics
}  // namespace errtree
