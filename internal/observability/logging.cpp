#include "internal/observability/logging.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace nove::observability {
namespace {

constexpr const char* kLoggerName     = "nove-api";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

spdlog::level::level_enum ResolveLevel(const nove::runtime::config::RuntimeConfig& config) {
  std::string name = "info";
  if (const char* env = Env("NOVE_LOG_LEVEL")) {
    name = env;
  } else if (!config.logging().level().empty()) {
    name = config.logging().level();
  }

  // from_str() maps unknown names to off.
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

std::string ResolvePattern(const nove::runtime::config::RuntimeConfig& config) {
  if (const char* env = Env("NOVE_LOG_PATTERN")) {
    return env;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return kDefaultPattern;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') return true;
  }
  return false;
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out.push_back(' ');
  out.append(field.key);
  out.push_back('=');
  if (!NeedsQuoting(field.value)) {
    out.append(field.value);
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') {
      out.append("\\n");
      continue;
    }
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    fmt::format_to(std::back_inserter(out), "{:02x}", data[i]);
  }
  return out;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, {"trace_id", HexId(trace_bytes, sizeof(trace_bytes))});
  AppendField(out, {"span_id", HexId(span_bytes, sizeof(span_bytes))});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DurationMsField(std::string_view key, double milliseconds) {
  return {std::string(key), fmt::format("{:.3f}", milliseconds)};
}

void InitializeLogging(const nove::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ResolveLevel(config));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(config.logging().include_trace_context(), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(suffix, field);
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace nove::observability
