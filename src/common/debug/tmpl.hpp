#pragma once

#include "../debug.hpp"

#include <string>

namespace errtree::debug::tmpl {

/// Template メッセージID
enum class Id {
    Compile,
    Placeholder,
    Escape,
    Error,
    SpecFallback,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Compiling template", "テンプレートをコンパイル"},
    {"Placeholder", "プレースホルダー"},
    {"Escaped brace", "エスケープされた括弧"},
    {"Template error", "テンプレートエラー"},
    {"Format suffix not applicable, rendering plain value",
     "書式指定を適用できないため素の値で出力"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::errtree::debug::g_lang];
}

inline void log(Id id, const std::string& detail,
                ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Template, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace errtree::debug::tmpl
