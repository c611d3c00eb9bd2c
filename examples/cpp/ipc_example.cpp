#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "redis_ipc/v1.hpp"

using namespace redis_ipc::v1;

int main(int argc, char** argv) {
  // Optional config argument; the in-memory store keeps the example self-contained.
  auto config = argc > 1 ? redis_ipc::config::ConfigLoader::LoadFromYaml(argv[1])
                         : redis_ipc::config::ConfigLoader::LoadFromYamlString("store:\n  backend: memory\n");
  redis_ipc::observability::InitializeLogging(config);

  auto runtime = redis_ipc::factory::Build(config);
  auto strings = std::make_shared<const StringCodec>();

  // Work queue. Structures built from one runtime share its identity, so the
  // consumer here stands in for another process with an identity of its own.
  auto producer         = redis_ipc::factory::MakeWriteQueue<std::string>(runtime, "jobs", strings);
  auto consumer_options = redis_ipc::factory::QueueOptionsFor(runtime.config, "jobs", "example-worker");
  ReadQueue<std::string> consumer(runtime.pool, runtime.poller, consumer_options, strings);
  producer.Push("A");
  producer.Push("B");
  while (auto job = consumer.Pop()) {
    std::cout << "job " << *job << '\n';
  }

  // Shared cache with expiry.
  auto sessions = redis_ipc::factory::MakeCache<std::string>(runtime, "sessions", strings);
  sessions.Set("u1", "tok", std::chrono::seconds(60));
  std::cout << "session u1=" << sessions.Get("u1").value_or("(expired)") << '\n';

  // Bounded event stream.
  auto logs = redis_ipc::factory::MakeEventStream<std::string>(runtime, "logs", strings);
  for (const char* line : {"e1", "e2", "e3", "e4"}) {
    logs.Append(line, 3);
  }
  auto range = logs.ReadFrom(StreamCursor::Beginning());
  while (auto event = range.Next()) {
    std::cout << event->cursor.ToString() << ' ' << event->value << '\n';
  }

  redis_ipc::observability::ShutdownLogging();
  return 0;
}
