#pragma once

#include "../debug.hpp"

#include <string>

namespace errtree::debug::emit {

/// Emitter メッセージID
enum class Id {
    Start,
    End,
    Variant,
    DocLine,
    Duplicate,
    Error,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting descriptor emission", "記述子の生成を開始"},
    {"Completed descriptor emission", "記述子の生成を完了"},
    {"Emitted variant", "バリアントを生成"},
    {"Documentation line", "ドキュメント行"},
    {"Duplicate entry", "重複エントリ"},
    {"Emission error", "生成エラー"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::errtree::debug::g_lang];
}

inline void log(Id id, ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Emit, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Emit, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace errtree::debug::emit
