#include <asciify/json.hpp>
#include <asciify/internal.hpp>

namespace asciify {

Json::Value ToJson(const ConversionStats& stats) {
  Json::Value json;
  json["in_chars"] = static_cast<Json::UInt64>(stats.in_chars);
  json["out_chars"] = static_cast<Json::UInt64>(stats.out_chars);
  json["removed"] = static_cast<Json::Int64>(stats.Removed());
  return json;
}

Json::Value ToJson(const ConversionResult& result) {
  Json::Value json;
  json["ascii"] = result.ascii;
  json["stats"] = ToJson(result.stats);
  return json;
}

Json::Value ToJson(const Stage& stage) {
  Json::Value json;
  json["ordinal"] = stage.ordinal;
  json["label"] = stage.label;
  json["description"] = stage.description;

  Json::Value rules(Json::arrayValue);
  for (size_t i = 0; i < stage.rule_count && i < internal::kRuleCount; ++i) {
    rules.append(internal::RuleName(internal::kRuleOrder[i]));
  }
  json["rules"] = rules;
  return json;
}

Json::Value StepResultToJson(int ordinal, const StepResult& step) {
  Json::Value json;
  json["ordinal"] = ordinal;
  const auto& stages = Stages();
  if (ordinal >= 0 && ordinal < static_cast<int>(stages.size())) {
    json["label"] = stages[static_cast<size_t>(ordinal)].label;
  }
  json["text"] = step.text;
  json["description"] = step.description;
  return json;
}

Json::Value StagesToJson() {
  Json::Value json(Json::arrayValue);
  for (const auto& stage : Stages()) {
    json.append(ToJson(stage));
  }
  return json;
}

std::string WriteCompact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

std::string WritePretty(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

}  // namespace asciify
