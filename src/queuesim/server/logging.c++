// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "logging.h"

#include <queuesim/server/log-schema.capnp.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/time.h>

namespace queuesim::server {

namespace {

log_schema::LogEntry::LogLevel severityToLogLevel(kj::LogSeverity severity) {
  switch (severity) {
    case kj::LogSeverity::INFO:
      return log_schema::LogEntry::LogLevel::INFO;
    case kj::LogSeverity::WARNING:
      return log_schema::LogEntry::LogLevel::WARNING;
    case kj::LogSeverity::ERROR:
      return log_schema::LogEntry::LogLevel::ERROR;
    case kj::LogSeverity::FATAL:
      return log_schema::LogEntry::LogLevel::FATAL;
    case kj::LogSeverity::DBG:
      return log_schema::LogEntry::LogLevel::DEBUG_;
  }
  KJ_UNREACHABLE;
}

}  // namespace

kj::String buildJsonLogMessage(
    kj::LogSeverity severity, const char* file, int line, int contextDepth, kj::StringPtr text) {
  capnp::MallocMessageBuilder message;
  auto logEntry = message.initRoot<log_schema::LogEntry>();

  logEntry.setTimestamp(
      (kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::MILLISECONDS);
  logEntry.setLevel(severityToLogLevel(severity));
  logEntry.setSource(kj::str(file, ":", line));
  logEntry.setMessage(text);
  if (contextDepth > 0) {
    logEntry.setContextDepth(static_cast<uint32_t>(contextDepth));
  }

  capnp::JsonCodec codec;
  codec.handleByAnnotation<log_schema::LogEntry>();
  return codec.encode(logEntry);
}

// =======================================================================================
// LogSink

LogSink::LogSink(kj::OutputStream& textOutput, kj::OutputStream& jsonOutput)
    : textOutput(textOutput),
      jsonOutput(jsonOutput) {}

kj::String LogSink::formatMessage(kj::LogSeverity severity, kj::StringPtr message) const {
  switch (format) {
    case Format::TEXT:
      return kj::str(message);
    case Format::JSON:
      return buildJsonLogMessage(severity, __FILE__, __LINE__, 0, message);
  }
  KJ_UNREACHABLE;
}

void LogSink::logMessage(
    kj::LogSeverity severity, const char* file, int line, int contextDepth, kj::String&& text) {
  if (severity == kj::LogSeverity::DBG && !showDebug) return;

  // Writing can fail and log in turn.
  if (loggingInProgress) return;
  loggingInProgress = true;
  KJ_DEFER(loggingInProgress = false);

  switch (format) {
    case Format::TEXT: {
      // Same layout as KJ's own stderr logger, with the context indented.
      auto entry = kj::str(kj::repeat('_', contextDepth), file, ":", line, ": ", severity, ": ",
          text, '\n');
      textOutput.write(entry.asBytes());
      return;
    }
    case Format::JSON: {
      auto json = buildJsonLogMessage(severity, file, line, contextDepth, text);
      jsonOutput.write({json.asBytes(), "\n"_kj.asBytes()});
      return;
    }
  }
}

// =======================================================================================
// QueuesimProcessContext

QueuesimProcessContext::QueuesimProcessContext(kj::StringPtr programName)
    : topLevelContext(programName) {}

kj::StringPtr QueuesimProcessContext::getProgramName() {
  return topLevelContext.getProgramName();
}

void QueuesimProcessContext::exit() {
  topLevelContext.exit();
}

void QueuesimProcessContext::warning(kj::StringPtr message) const {
  topLevelContext.warning(sink.formatMessage(kj::LogSeverity::WARNING, message));
}

void QueuesimProcessContext::error(kj::StringPtr message) const {
  topLevelContext.error(sink.formatMessage(kj::LogSeverity::ERROR, message));
}

void QueuesimProcessContext::exitError(kj::StringPtr message) {
  topLevelContext.exitError(sink.formatMessage(kj::LogSeverity::ERROR, message));
}

void QueuesimProcessContext::exitInfo(kj::StringPtr message) {
  topLevelContext.exitInfo(sink.formatMessage(kj::LogSeverity::INFO, message));
}

void QueuesimProcessContext::increaseLoggingVerbosity() {
  topLevelContext.increaseLoggingVerbosity();
  sink.setShowDebug(true);
}

}  // namespace queuesim::server
