// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/exception.h>
#include <kj/io.h>
#include <kj/main.h>
#include <kj/miniposix.h>
#include <kj/string.h>

namespace queuesim::server {

// Encodes one log-schema.capnp LogEntry as a single line of JSON, without the trailing newline.
kj::String buildJsonLogMessage(
    kj::LogSeverity severity, const char* file, int line, int contextDepth, kj::StringPtr text);

// Receives every KJ_LOG on the thread for as long as it exists, and writes it as plain text or
// as JSON. Debug messages are dropped unless enabled: KJ_LOG(DBG) bypasses the log level, and the
// broker logs every retry at DBG.
class LogSink final: public kj::ExceptionCallback {
 public:
  enum class Format {
    TEXT,
    JSON,
  };

  // Text goes to `textOutput` and JSON to `jsonOutput`; both must outlive the sink.
  LogSink(kj::OutputStream& textOutput, kj::OutputStream& jsonOutput);

  void setFormat(Format newFormat) {
    format = newFormat;
  }
  Format getFormat() const {
    return format;
  }
  void setShowDebug(bool show) {
    showDebug = show;
  }

  // Renders a message reported outside of KJ_LOG (warnings and errors from the process context)
  // in the current format.
  kj::String formatMessage(kj::LogSeverity severity, kj::StringPtr message) const;

  void logMessage(kj::LogSeverity severity,
      const char* file,
      int line,
      int contextDepth,
      kj::String&& text) override;

  StackTraceMode stackTraceMode() override {
    return StackTraceMode::ADDRESS_ONLY;
  }

 private:
  kj::OutputStream& textOutput;
  kj::OutputStream& jsonOutput;
  Format format = Format::TEXT;
  bool showDebug = false;
  bool loggingInProgress = false;
};

// The process context of the queuesim binary. Usage errors and exit messages follow the log
// sink's format, and --verbose turns debug messages on.
class QueuesimProcessContext final: public kj::ProcessContext {
 public:
  explicit QueuesimProcessContext(kj::StringPtr programName);

  LogSink& getLogSink() {
    return sink;
  }

  kj::StringPtr getProgramName() override;
  KJ_NORETURN(void exit() override);
  void warning(kj::StringPtr message) const override;
  void error(kj::StringPtr message) const override;
  KJ_NORETURN(void exitError(kj::StringPtr message) override);
  KJ_NORETURN(void exitInfo(kj::StringPtr message) override);
  void increaseLoggingVerbosity() override;

 private:
  kj::TopLevelProcessContext topLevelContext;
  kj::FdOutputStream stdoutStream{STDOUT_FILENO};
  kj::FdOutputStream stderrStream{STDERR_FILENO};
  LogSink sink{stderrStream, stdoutStream};
};

}  // namespace queuesim::server
