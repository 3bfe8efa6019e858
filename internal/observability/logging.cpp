#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace dashstream::observability {
namespace {

namespace cfg = dashstream::runtime::config;

constexpr const char* kLoggerName     = "dashstream";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";

// Field keys whose values are bearer credentials.
constexpr std::array<std::string_view, 3> kRedactedKeys = {"session_token", "token", "st"};

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool IsRedacted(std::string_view key) {
  for (auto redacted : kRedactedKeys) {
    if (key == redacted) {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& line, std::string_view value) {
  const bool quote = value.empty() || value.find_first_of(" \"=\n\t") != std::string_view::npos;
  if (!quote) {
    line.append(value);
    return;
  }

  line.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        line.append("\\\"");
        break;
      case '\n':
        line.append("\\n");
        break;
      case '\t':
        line.append("\\t");
        break;
      default:
        line.push_back(c);
    }
  }
  line.push_back('"');
}

void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line.push_back(' ');
  line.append(key);
  line.push_back('=');
  if (IsRedacted(key)) {
    line.append("[redacted]");
    return;
  }
  AppendValue(line, value);
}

#ifdef ENABLE_OTEL
std::string Hex(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  uint8_t trace_id[16];
  uint8_t span_id[8];
  span->GetContext().trace_id().CopyBytesTo(trace_id);
  span->GetContext().span_id().CopyBytesTo(span_id);
  AppendField(line, "trace_id", Hex(trace_id, sizeof(trace_id)));
  AppendField(line, "span_id", Hex(span_id, sizeof(span_id)));
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

void InitializeLogging(const cfg::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("DASHSTREAM_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("DASHSTREAM_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto trace_env    = EnvOr("DASHSTREAM_LOG_INCLUDE_TRACE_CONTEXT", "", "");
  g_include_trace_context = trace_env.empty() ? logging.include_trace_context() : (trace_env == "1" || trace_env == "true");
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace dashstream::observability
