#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace chronicle::observability {
namespace {

constexpr const char* kLoggerName     = "chronicle";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

/*
  Effective logger settings. CHRONICLE_LOG_* environment variables override
  the logging block of the config file.
*/
struct LogSettings {
  std::string level{"info"};
  std::string pattern{kDefaultPattern};
  bool        include_trace_context{false};
};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

LogSettings ResolveSettings(const chronicle::runtime::config::LoggingConfig& logging) {
  LogSettings settings;
  if (!logging.level().empty()) settings.level = logging.level();
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  settings.include_trace_context = logging.include_trace_context();

  if (const char* level = Env("CHRONICLE_LOG_LEVEL")) settings.level = level;
  if (const char* pattern = Env("CHRONICLE_LOG_PATTERN")) settings.pattern = pattern;
  if (const char* trace = Env("CHRONICLE_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(trace);
    settings.include_trace_context = flag == "1" || flag == "true";
  }
  return settings;
}

// Values with spaces or quotes are quoted so key=value pairs stay parseable.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

#ifdef ENABLE_OTEL
template <size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_id[16];
  uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  line += " trace_id=" + Hex(trace_id) + " span_id=" + Hex(span_id);
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

void InitializeLogging(const chronicle::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config.logging());

  // from_str maps unknown names to off; only an explicit "off" silences the logger.
  auto level           = spdlog::level::from_str(settings.level);
  const bool bad_level = level == spdlog::level::off && settings.level != "off";
  if (bad_level) level = spdlog::level::info;

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;

  if (bad_level) LogWarn("unknown log level, using info", {StringField("level", settings.level)});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace chronicle::observability
