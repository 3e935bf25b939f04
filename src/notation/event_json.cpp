// Implementation of event list JSON rendering.

#include "notation/event_json.h"

#include "core/json_helpers.h"

namespace tonelang {

namespace {

void writeEvents(JsonWriter& writer, const std::vector<Event>& events) {
  writer.beginArray();
  for (const auto& event : events) {
    writer.beginObject();
    writer.key("pitch");
    writer.value(event.pitch);
    writer.key("start_time");
    writer.value(event.start_time);
    writer.key("duration");
    writer.value(event.duration);
    writer.key("velocity");
    writer.value(event.velocity);
    writer.endObject();
  }
  writer.endArray();
}

}  // namespace

std::string buildEventsJson(const std::vector<Event>& events, int indent_size) {
  JsonWriter writer(indent_size);
  writeEvents(writer, events);
  return writer.toString();
}

std::string buildScoreJson(const std::vector<Event>& events, const Rational& score_beats,
                           int indent_size) {
  JsonWriter writer(indent_size);
  writer.beginObject();
  writer.key("duration");
  writer.value(score_beats);
  writer.key("note_count");
  writer.value(static_cast<int>(events.size()));
  writer.key("notes");
  writeEvents(writer, events);
  writer.endObject();
  return writer.toString();
}

std::string buildScoreJson(const CompiledScore& compiled, int indent_size) {
  return buildScoreJson(compiled.events, compiled.duration, indent_size);
}

}  // namespace tonelang
