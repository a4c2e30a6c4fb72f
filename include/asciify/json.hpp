#pragma once

#include <asciify/stages.hpp>
#include <asciify/transliterate.hpp>

#include <json/json.h>

#include <string>

namespace asciify {

/** {"ascii": ..., "stats": {"in_chars", "out_chars", "removed"}} */
Json::Value ToJson(const ConversionResult& result);

Json::Value ToJson(const ConversionStats& stats);

/** {"ordinal", "label", "description", "rules": [rule names]} */
Json::Value ToJson(const Stage& stage);

/** {"ordinal", "label", "text", "description"} */
Json::Value StepResultToJson(int ordinal, const StepResult& step);

/** Array of ToJson(stage) for every stage. */
Json::Value StagesToJson();

/** Compact single-line rendering. */
std::string WriteCompact(const Json::Value& value);

/** Indented rendering for terminals. */
std::string WritePretty(const Json::Value& value);

}  // namespace asciify
