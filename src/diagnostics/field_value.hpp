#pragma once

// ============================================================
// フィールド値 - エラー値に束縛される実行時の値
// ============================================================

#include "common/source.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace errtree {
namespace diagnostics {

class DiagnosticFacade;

using DiagnosticPtr = std::shared_ptr<const DiagnosticFacade>;

/// フィールド値（文字列、整数、浮動小数点、真偽値、位置、入れ子の診断）
using FieldValue = std::variant<std::string, int64_t, double, bool, SourceSpan, DiagnosticPtr>;

using FieldValues = std::vector<FieldValue>;

/// 値の種類名（エラーメッセージ用）
inline const char* field_value_type_name(const FieldValue& value) {
    switch (value.index()) {
        case 0:
            return "string";
        case 1:
            return "integer";
        case 2:
            return "float";
        case 3:
            return "bool";
        case 4:
            return "span";
        case 5:
            return "diagnostic";
    }
    return "unknown";
}

}  // namespace diagnostics
}  // namespace errtree
