#pragma once

// デバッグメッセージ統合ヘッダ
// 各ステージのメッセージを一括インクルード

#include "debug/emit.hpp"
#include "debug/lex.hpp"
#include "debug/par.hpp"
#include "debug/res.hpp"
#include "debug/tmpl.hpp"

// 使用例:
// debug::lex::log(debug::lex::Id::Start);
// debug::par::log(debug::par::Id::Leaf, "FileNotFound", debug::Level::Trace);
