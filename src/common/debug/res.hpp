#pragma once

#include "../debug.hpp"

#include <string>

namespace errtree::debug::res {

/// Resolver メッセージID
enum class Id {
    WalkStart,
    WalkEnd,
    VisitGroup,
    VisitLeaf,
    PushFrame,
    PopFrame,
    Merge,
    Abort,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting tree walk", "木の走査を開始"},
    {"Completed tree walk", "木の走査を完了"},
    {"Visiting group", "グループを訪問"},
    {"Visiting leaf", "リーフを訪問"},
    {"Pushing frame", "フレームをプッシュ"},
    {"Popping frame", "フレームをポップ"},
    {"Merged attributes", "属性をマージ"},
    {"Walk aborted", "走査を中断"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::errtree::debug::g_lang];
}

inline void log(Id id, ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Resolve, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Resolve, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace errtree::debug::res
