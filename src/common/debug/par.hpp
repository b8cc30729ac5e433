#pragma once

#include "../debug.hpp"

#include <string>

namespace errtree::debug::par {

/// Parser メッセージID
enum class Id {
    Start,
    End,
    Taxonomy,
    Attribute,
    Group,
    Leaf,
    Field,
    SpanMarker,
    Error,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting parsing", "構文解析を開始"},
    {"Completed parsing", "構文解析を完了"},
    {"Parsing taxonomy", "エラー分類を解析"},
    {"Parsing attribute", "属性を解析"},
    {"Parsing group", "グループを解析"},
    {"Parsing leaf", "リーフを解析"},
    {"Parsing field", "フィールドを解析"},
    {"Span marker", "spanマーカー"},
    {"Parse error", "構文解析エラー"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::errtree::debug::g_lang];
}

inline void log(Id id, ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Parser, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Parser, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace errtree::debug::par
