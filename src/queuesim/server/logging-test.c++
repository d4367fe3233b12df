// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "logging.h"

#include <queuesim/queue/test-fixture.h>
#include <queuesim/server/log-schema.capnp.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/io.h>
#include <kj/test.h>

namespace queuesim::server {
namespace {

kj::String textOf(kj::VectorOutputStream& stream) {
  return kj::heapString(stream.getArray().asChars());
}

void decodeEntry(kj::StringPtr json, capnp::MallocMessageBuilder& message) {
  capnp::JsonCodec codec;
  codec.handleByAnnotation<log_schema::LogEntry>();
  codec.decode(json, message.initRoot<log_schema::LogEntry>());
}

KJ_TEST("buildJsonLogMessage") {
  auto before = (kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::MILLISECONDS;
  auto json = buildJsonLogMessage(kj::LogSeverity::WARNING, "queue.c++", 42, 2, "hello \"there\"");
  KJ_EXPECT(json.findFirst('\n') == kj::none);
  KJ_EXPECT(json.contains("\"context_depth\":2"), json);

  capnp::MallocMessageBuilder message;
  decodeEntry(json, message);
  auto entry = message.getRoot<log_schema::LogEntry>().asReader();
  KJ_EXPECT(entry.getTimestamp() >= before);
  KJ_EXPECT(entry.getLevel() == log_schema::LogEntry::LogLevel::WARNING);
  KJ_EXPECT(entry.getSource() == "queue.c++:42");
  KJ_EXPECT(entry.getMessage() == "hello \"there\"");
  KJ_EXPECT(entry.getContextDepth() == 2);

  // Top-level messages leave the context depth out.
  auto dbg = buildJsonLogMessage(kj::LogSeverity::DBG, "broker.c++", 7, 0, "retrying");
  KJ_EXPECT(!dbg.contains("context_depth"), dbg);
  KJ_EXPECT(dbg.contains("\"level\":\"debug\""), dbg);
}

KJ_TEST("LogSink writes text or JSON") {
  kj::VectorOutputStream text;
  kj::VectorOutputStream json;
  LogSink sink(text, json);
  KJ_EXPECT(sink.getFormat() == LogSink::Format::TEXT);

  KJ_LOG(WARNING, "plain warning");
  auto textOutput = textOf(text);
  KJ_EXPECT(textOutput.contains(": warning: plain warning\n"), textOutput);
  KJ_EXPECT(textOutput.contains("logging-test.c++:"), textOutput);
  KJ_EXPECT(json.getArray().size() == 0);

  sink.setFormat(LogSink::Format::JSON);
  KJ_LOG(ERROR, "structured error");
  KJ_EXPECT(textOf(text) == textOutput);

  auto jsonOutput = textOf(json);
  KJ_ASSERT(jsonOutput.endsWith("\n"), jsonOutput);
  KJ_EXPECT(jsonOutput.slice(0, jsonOutput.size() - 1).findFirst('\n') == kj::none, jsonOutput);

  capnp::MallocMessageBuilder message;
  decodeEntry(jsonOutput.slice(0, jsonOutput.size() - 1), message);
  auto entry = message.getRoot<log_schema::LogEntry>().asReader();
  KJ_EXPECT(entry.getLevel() == log_schema::LogEntry::LogLevel::ERROR);
  KJ_EXPECT(entry.getMessage() == "structured error");
}

KJ_TEST("LogSink drops debug messages until enabled") {
  kj::VectorOutputStream text;
  kj::VectorOutputStream json;
  LogSink sink(text, json);

  KJ_LOG(DBG, "hidden");
  KJ_EXPECT(text.getArray().size() == 0);

  sink.setShowDebug(true);
  KJ_LOG(DBG, "shown");
  auto output = textOf(text);
  KJ_EXPECT(output.contains(": debug: shown\n"), output);
  KJ_EXPECT(!output.contains("hidden"), output);
}

KJ_TEST("LogSink formats process context messages") {
  kj::VectorOutputStream text;
  kj::VectorOutputStream json;
  LogSink sink(text, json);

  KJ_EXPECT(sink.formatMessage(kj::LogSeverity::INFO, "Config is valid.") == "Config is valid.");

  sink.setFormat(LogSink::Format::JSON);
  capnp::MallocMessageBuilder message;
  decodeEntry(sink.formatMessage(kj::LogSeverity::INFO, "Config is valid."), message);
  auto entry = message.getRoot<log_schema::LogEntry>().asReader();
  KJ_EXPECT(entry.getLevel() == log_schema::LogEntry::LogLevel::INFO);
  KJ_EXPECT(entry.getMessage() == "Config is valid.");

  // Nothing reaches the streams.
  KJ_EXPECT(text.getArray().size() == 0);
  KJ_EXPECT(json.getArray().size() == 0);
}

KJ_TEST("queue activity through the sink") {
  kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  KJ_DEFER(kj::_::Debug::setLogLevel(kj::LogSeverity::WARNING));

  kj::VectorOutputStream text;
  kj::VectorOutputStream json;
  LogSink sink(text, json);

  test::QueueFixture f;
  auto& consumer = f.attach("queue", 5, 1 * kj::SECONDS, 2);
  consumer.respond = [](const test::FakeDispatcher::Call&) {
    return kj::Promise<QueueResponse>(QueueResponse{.retryAll = true});
  };

  f.send("queue", "first");
  f.advance(1 * kj::SECONDS);
  auto quiet = textOf(text);
  KJ_EXPECT(quiet.contains(": info: QUEUE queue 0/1 (0ms)\n"), quiet);
  KJ_EXPECT(!quiet.contains("Retrying message"), quiet);

  // --verbose shows every retry.
  sink.setShowDebug(true);
  f.advance(1 * kj::SECONDS);
  auto verbose = textOf(text);
  KJ_EXPECT(verbose.contains(": debug: Retrying message \""), verbose);
  KJ_EXPECT(verbose.contains("\" on queue \"queue\"...\n"), verbose);
  KJ_EXPECT(consumer.calls.size() == 2);
}

}  // namespace
}  // namespace queuesim::server
