#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace forecast::observability {
namespace {

constexpr const char* kLoggerName     = "forecast-sync";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\r\n\"=") != std::string_view::npos;
}

// key=value, with values carrying spaces or quotes (error text, user input)
// wrapped in double quotes.
void AppendField(std::string& out, const LogField& field) {
  out += field.key;
  out += '=';
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  out += " trace_id=";
  out.append(trace_id, sizeof(trace_id));
  out += " span_id=";
  out.append(span_id, sizeof(span_id));
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

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
  if (name.empty()) {
    return spdlog::level::info;
  }
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str falls back to off for anything it does not know.
  if (level == spdlog::level::off && name != "off") {
    throw util::ConfigurationError("unknown log level '" + std::string(name) + "'");
  }
  return level;
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    AppendField(line, field);
  }
  return line;
}

void InitializeLogging(const forecast::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // FORECAST_LOG_LEVEL lets an operator raise verbosity without a config
  // change.
  const char* env_level = std::getenv("FORECAST_LOG_LEVEL");
  const auto  level     = ParseLogLevel(env_level != nullptr ? std::string_view(env_level) : std::string_view(logging.level()));

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(logging.pattern().empty() ? kDefaultPattern : logging.pattern());
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context.store(logging.include_trace_context(), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  auto line = FormatLogLine(message, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace forecast::observability
