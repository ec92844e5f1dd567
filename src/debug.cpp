#include "debug.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <iostream>
#include <string>

namespace perftree {
namespace {

constexpr std::size_t kTopicCount = static_cast<std::size_t>(TraceTopic::Count);

constexpr std::array<std::string_view, kTopicCount> kTopicNames = {
    "process", "engine", "script", "session"};

std::array<std::atomic<bool>, kTopicCount> g_trace_flags{};
TraceWriter g_trace_writer = nullptr;

bool same_word(std::string_view lhs, std::string_view rhs) {
  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

}  // namespace

void set_trace_topic(TraceTopic topic, bool enabled) {
  g_trace_flags[static_cast<std::size_t>(topic)].store(enabled, std::memory_order_relaxed);
}

void set_all_trace_topics(bool enabled) {
  for (auto& flag : g_trace_flags) {
    flag.store(enabled, std::memory_order_relaxed);
  }
}

bool trace_enabled(TraceTopic topic) {
  return g_trace_flags[static_cast<std::size_t>(topic)].load(std::memory_order_relaxed);
}

void set_trace_writer(TraceWriter writer) {
  g_trace_writer = writer;
}

std::optional<TraceTopic> trace_topic_from_string(std::string_view token) {
  for (std::size_t idx = 0; idx < kTopicCount; ++idx) {
    if (same_word(token, kTopicNames[idx])) {
      return static_cast<TraceTopic>(idx);
    }
  }
  return std::nullopt;
}

std::string_view trace_topic_name(TraceTopic topic) {
  const auto idx = static_cast<std::size_t>(topic);
  return idx < kTopicCount ? kTopicNames[idx] : "unknown";
}

void trace_emit(TraceTopic topic, std::string_view message) {
  if (!trace_enabled(topic)) {
    return;
  }
  std::string payload = "trace ";
  payload.append(trace_topic_name(topic));
  payload.push_back(' ');
  payload.append(message);
  if (g_trace_writer) {
    g_trace_writer(topic, payload);
  } else {
    std::cerr << payload << std::endl;
  }
}

}  // namespace perftree
