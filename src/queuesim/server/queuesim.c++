// Copyright (c) 2023 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "config.h"
#include "http-dispatcher.h"
#include "ingress-service.h"
#include "logging.h"

#include <queuesim/queue/broker.h>

#include <signal.h>

#include <capnp/message.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/main.h>

namespace queuesim::server {

namespace {

constexpr kj::StringPtr VERSION = "queuesim 0.1.0"_kj;
constexpr uint DEFAULT_PORT = 8787;

// =======================================================================================
// Some generic CLI helpers so that we can throw exceptions rather than return
// kj::MainBuilder::Validity.

class CliError {
 public:
  CliError(kj::String description): description(kj::mv(description)) {}
  kj::String description;
};

template <typename Func>
auto cliMethod(Func&& func) {
  return [func = kj::fwd<Func>(func)](auto&&... params) mutable -> kj::MainBuilder::Validity {
    try {
      func(kj::fwd<decltype(params)>(params)...);
      return true;
    } catch (CliError& e) {
      return kj::mv(e.description);
    }
  };
}

#define CLI_METHOD(name) cliMethod(KJ_BIND_METHOD(*this, name))
// Pass to MainBuilder when a function returning kj::MainBuilder::Validity is needed, implemented
// by a method of this class.

#define CLI_ERROR(...) throw CliError(kj::str(__VA_ARGS__))
// Throws an exception that is caught and reported as a usage error.

// =======================================================================================

class CliMain final {
 public:
  explicit CliMain(QueuesimProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, VERSION, "Simulates a message queue broker.")
        .addSubCommand("serve", KJ_BIND_METHOD(*this, getServe), "run the broker")
        .addSubCommand("check", KJ_BIND_METHOD(*this, getCheck), "validate a config file")
        .build();
  }

  kj::MainFunc getServe() {
    auto builder = kj::MainBuilder(context, VERSION,
        "Accepts messages over HTTP at POST /<queue>/message and POST /<queue>/batch and delivers "
        "them in batches to the consumer services named in <config-file>. Pass --verbose to see "
        "every retry.");
    return builder
        .addOptionWithArg({'l', "listen"}, CLI_METHOD(overrideListen), "<addr>",
            "Listen for producers on <addr> instead of the config's \"listen\" address.")
        .addOption({"structured-logging"},
            [this]() {
              context.getLogSink().setFormat(LogSink::Format::JSON);
              return true;
            },
            "Write log messages to stdout as JSON, one object per line.")
        .expectArg("<config-file>", CLI_METHOD(parseConfigFile))
        .callAfterParsing(CLI_METHOD(serve))
        .build();
  }

  kj::MainFunc getCheck() {
    auto builder = kj::MainBuilder(context, VERSION,
        "Loads <config-file> and reports whether its queues and consumers are valid.");
    return builder.expectArg("<config-file>", CLI_METHOD(parseConfigFile))
        .callAfterParsing(CLI_METHOD(check))
        .build();
  }

  void overrideListen(kj::StringPtr addr) {
    listenOverride = kj::str(addr);
  }

  void parseConfigFile(kj::StringPtr pathStr) {
    auto path = fs->getCurrentPath().evalNative(pathStr);
    auto file = KJ_UNWRAP_OR(fs->getRoot().tryOpenFile(path), CLI_ERROR("No such file."));
    auto text = file->readAllText();

    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      auto parsed = parseConfig(text, configMessage);
      consumers = parseConsumers(parsed);
      config = parsed;
    })) {
      CLI_ERROR(exception.getDescription());
    }
  }

  [[noreturn]] void check() {
    for (auto& consumer: consumers) {
      context.warning(kj::str("queue \"", consumer.queueName, "\" -> service \"",
          consumer.serviceName, "\" at ", consumer.serviceUrl));
    }
    context.exitInfo(kj::str("Config is valid (", consumers.size(), " consumer(s))."));
  }

  [[noreturn]] void serve() noexcept {
    // The per-flush summaries are logged at INFO.
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);

    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { run().wait(io.waitScope); })) {
      context.exitError(kj::str(exception));
    }
    context.exit();
  }

 private:
  QueuesimProcessContext& context;

  kj::Own<kj::Filesystem> fs = kj::newDiskFilesystem();
  kj::AsyncIoContext io = kj::setupAsyncIo();

  capnp::MallocMessageBuilder configMessage;
  kj::Maybe<config::Config::Reader> config;
  kj::Array<ConsumerConfig> consumers;
  kj::Maybe<kj::String> listenOverride;

  kj::StringPtr getListenAddress() {
    KJ_IF_SOME(addr, listenOverride) {
      return addr;
    }
    return KJ_ASSERT_NONNULL(config).getListen();
  }

  kj::Promise<void> run() {
    auto& timer = io.provider->getTimer();
    auto& network = io.provider->getNetwork();

    // The broker's dispatchers and their clients refer to the header table, so the table is
    // declared first and destroyed last.
    kj::HttpHeaderTable::Builder headerTableBuilder;
    kj::Own<kj::HttpHeaderTable> headerTable;

    QueueBroker broker(timer, kj::systemPreciseCalendarClock());
    IngressService ingress(broker, headerTableBuilder);
    headerTable = headerTableBuilder.build();

    for (auto& consumer: consumers) {
      auto client = kj::newHttpClient(timer, *headerTable, network, kj::none);
      broker.setConsumer(consumer.queueName,
          Consumer{
            .maxBatchSize = consumer.maxBatchSize,
            .maxBatchTimeout = consumer.maxBatchTimeout,
            .maxRetries = consumer.maxRetries,
            .deadLetterQueue =
                consumer.deadLetterQueue.map([](kj::String& name) { return kj::str(name); }),
            .dispatcher = kj::refcounted<HttpQueueDispatcher>(
                kj::mv(client), *headerTable, kj::str(consumer.serviceUrl)),
          });
      KJ_LOG(INFO,
          kj::str("Queue \"", consumer.queueName, "\" is consumed by \"", consumer.serviceName,
              "\" at ", consumer.serviceUrl));
    }

    auto listenAddress = getListenAddress();
    auto address = co_await network.parseAddress(listenAddress, DEFAULT_PORT);
    auto listener = address->listen();
    kj::HttpServer server(timer, *headerTable, ingress);
    KJ_LOG(INFO, kj::str("Listening for producers on ", address->toString()));

    // Stop accepting messages once SIGTERM is received.
    co_await server.listenHttp(*listener).exclusiveJoin(
        io.unixEventPort.onSignal(SIGTERM).ignoreResult());
    broker.dispose();
  }
};

}  // namespace
}  // namespace queuesim::server

int main(int argc, char* argv[]) {
  queuesim::server::QueuesimProcessContext context(argv[0]);
  kj::UnixEventPort::captureSignal(SIGTERM);
  queuesim::server::CliMain mainObject(context);
  return ::kj::runMainAndExit(context, mainObject.getMain(), argc, argv);
}
