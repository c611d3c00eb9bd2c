#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cache.hpp"
#include "internal/codec/codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/queue.hpp"
#include "internal/stream/event_stream.hpp"
#include "internal/util/errors.hpp"

using redis_ipc::codec::StringCodec;
using redis_ipc::factory::Runtime;
using redis_ipc::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ipcctl --config <file> cache-set <cache> <key> <value> [ttl_ms]\n"
            << "  ipcctl --config <file> cache-get <cache> <key> [--wait]\n"
            << "  ipcctl --config <file> cache-del <cache> <key>\n"
            << "  ipcctl --config <file> push <queue> <value>\n"
            << "  ipcctl --config <file> pop <queue> [--wait]\n"
            << "  ipcctl --config <file> append <stream> <value>\n"
            << "  ipcctl --config <file> read <stream> [cursor]\n"
            << "  ipcctl --config <file> tail <stream> [count]\n"
            << "  ipcctl --config <file> ping\n";
}

static bool HasFlag(const std::vector<std::string>& args, std::size_t from, const std::string& flag) {
  for (std::size_t i = from; i < args.size(); ++i) {
    if (args[i] == flag) {
      return true;
    }
  }
  return false;
}

static std::shared_ptr<const StringCodec> Strings() {
  static const auto codec = std::make_shared<const StringCodec>();
  return codec;
}

static int Run(Runtime& runtime, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "ping") {
    auto conn = runtime.pool->Acquire();
    conn->Ping();
    std::cout << "PONG " << runtime.store->Describe() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cache-set") {
    if (args.size() < 4) return 1;

    auto cache = redis_ipc::factory::MakeCache<std::string>(runtime, args[1], Strings());
    if (args.size() >= 5) {
      cache.Set(args[2], args[3], std::chrono::milliseconds(std::stoll(args[4])));
    } else {
      cache.Set(args[2], args[3]);
    }
    std::cout << "stored\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cache-get") {
    if (args.size() < 3) return 1;

    auto cache = redis_ipc::factory::MakeCache<std::string>(runtime, args[1], Strings());
    if (HasFlag(args, 3, "--wait")) {
      std::cout << cache.GetBlocking(args[2]) << "\n";
      return 0;
    }

    auto element = cache.GetElement(args[2]);
    if (!element) {
      std::cout << "(nil)\n";
      return 0;
    }
    std::cout << element->value << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cache-del") {
    if (args.size() < 3) return 1;

    auto cache = redis_ipc::factory::MakeCache<std::string>(runtime, args[1], Strings());
    std::cout << (cache.Delete(args[2]) ? "deleted" : "not found") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "push") {
    if (args.size() < 3) return 1;

    auto queue = redis_ipc::factory::MakeWriteQueue<std::string>(runtime, args[1], Strings());
    std::cout << "id=" << queue.Push(args[2]) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pop") {
    if (args.size() < 2) return 1;

    auto queue = redis_ipc::factory::MakeReadQueue<std::string>(runtime, args[1], Strings());
    if (HasFlag(args, 2, "--wait")) {
      auto message = queue.PopMessageBlocking(queue.Options().timeout);
      std::cout << message.value << "\n";
      return 0;
    }

    auto message = queue.PopMessage();
    if (!message) {
      std::cout << "(empty)\n";
      return 0;
    }
    std::cout << message->value << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "append") {
    if (args.size() < 3) return 1;

    auto stream = redis_ipc::factory::MakeEventStream<std::string>(runtime, args[1], Strings());
    std::cout << "cursor=" << stream.Append(args[2]).ToString() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "read") {
    if (args.size() < 2) return 1;

    auto stream = redis_ipc::factory::MakeEventStream<std::string>(runtime, args[1], Strings());
    auto after  = args.size() >= 3 ? redis_ipc::stream::StreamCursor::Parse(args[2]) : redis_ipc::stream::StreamCursor::Beginning();

    auto range = stream.ReadFrom(after);
    while (auto event = range.Next()) {
      std::cout << event->cursor.ToString() << " " << event->value << "\n";
    }
    std::cout << "cursor=" << range.Cursor().ToString() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tail") {
    if (args.size() < 2) return 1;

    const long count  = args.size() >= 3 ? std::stol(args[2]) : 1;
    auto       stream = redis_ipc::factory::MakeEventStream<std::string>(runtime, args[1], Strings());
    auto       reader = stream.Reader();
    reader.Resync();

    for (long i = 0; i < count; ++i) {
      auto event = reader.NextBlocking();
      std::cout << event.cursor.ToString() << " " << event.value << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = redis_ipc::config::ConfigLoader::LoadFromYaml(config_path);
    redis_ipc::observability::InitializeLogging(config);

    auto runtime = redis_ipc::factory::Build(config);
    int  rc      = Run(runtime, args);
    if (rc == 1) {
      Usage();
    }
    redis_ipc::observability::ShutdownLogging();
    return rc;
  } catch (const redis_ipc::util::Timeout& e) {
    std::cerr << "timeout: " << e.what() << "\n";
    redis_ipc::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    REDIS_IPC_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    redis_ipc::observability::ShutdownLogging();
    return 2;
  }
}
