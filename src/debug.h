#pragma once
// debug.h -- Trace toggles for diagnosing backend conversations.

#include <cstdint>
#include <optional>
#include <string_view>

namespace perftree {

enum class TraceTopic : std::uint8_t {
  Process = 0,
  Engine,
  Script,
  Session,
  Count
};

using TraceWriter = void (*)(TraceTopic topic, std::string_view payload);

void set_trace_topic(TraceTopic topic, bool enabled);
void set_all_trace_topics(bool enabled);
bool trace_enabled(TraceTopic topic);
std::optional<TraceTopic> trace_topic_from_string(std::string_view token);
std::string_view trace_topic_name(TraceTopic topic);

// nullptr restores the default stderr sink.
void set_trace_writer(TraceWriter writer);
void trace_emit(TraceTopic topic, std::string_view message);

}  // namespace perftree
