#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chronicle/v1/admin.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/eventstore/event_proto.hpp"
#include "internal/eventstore/event_query_service.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/projection_orchestrator.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/readmodel/product_catalog.hpp"
#include "internal/readmodel/product_proto.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr int kExitUsage      = 1;
constexpr int kExitValidation = 2;
constexpr int kExitConflict   = 3;
constexpr int kExitStorage    = 4;
constexpr int kExitProjection = 5;
constexpr int kExitNotFound   = 6;

void Usage() {
  std::cout << "Usage:\n"
            << "  chroniclectl <config.yaml> append <aggregate_type> <aggregate_id> <expected_version> <event_type> <payload_json>\n"
            << "               [--metadata <json>] [--correlation-id <id>] [--causation-id <id>] [--user-id <id>]\n"
            << "  chroniclectl <config.yaml> read-stream <aggregate_type> <aggregate_id> [from_version]\n"
            << "  chroniclectl <config.yaml> events-after <cursor|-> [limit]\n"
            << "  chroniclectl <config.yaml> latest\n"
            << "  chroniclectl <config.yaml> status [projection]\n"
            << "  chroniclectl <config.yaml> health\n"
            << "  chroniclectl <config.yaml> catch-up\n"
            << "  chroniclectl <config.yaml> rebuild\n"
            << "  chroniclectl <config.yaml> product get <id>\n"
            << "  chroniclectl <config.yaml> product by-sku <sku>\n"
            << "  chroniclectl <config.yaml> product list [--status <s>] [--min-price <cents>] [--max-price <cents>]\n"
            << "               [--sort name|price|newest] [--limit <n>] [--offset <n>] [--include-deleted]\n"
            << "  chroniclectl <config.yaml> product search <term> [limit]\n";
}

uint64_t ParseCount(const std::string& text, const char* what) {
  size_t   used  = 0;
  uint64_t value = 0;
  try {
    value = std::stoull(text, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != text.size() || text.empty() || text[0] == '-') {
    throw chronicle::util::ValidationError(std::string("invalid ") + what + ": " + text);
  }
  return value;
}

int64_t ParseCents(const std::string& text, const char* what) {
  size_t  used  = 0;
  int64_t value = 0;
  try {
    value = std::stoll(text, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != text.size() || text.empty()) {
    throw chronicle::util::ValidationError(std::string("invalid ") + what + ": " + text);
  }
  return value;
}

chronicle::db::model::ProductSort ParseSort(const std::string& text) {
  if (text == "name") return chronicle::db::model::ProductSort::kName;
  if (text == "price") return chronicle::db::model::ProductSort::kPriceAsc;
  if (text == "newest") return chronicle::db::model::ProductSort::kNewest;
  throw chronicle::util::ValidationError("invalid sort: " + text + " (expected name, price or newest)");
}

void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  std::cout << json;
}

int Append(chronicle::factory::RuntimeDependencies& deps, const std::vector<std::string>& args) {
  if (args.size() < 5) {
    Usage();
    return kExitUsage;
  }

  chronicle::eventstore::NewEvent event;
  event.event_type = args[3];
  event.payload    = args[4];

  for (size_t i = 5; i < args.size(); i += 2) {
    if (i + 1 >= args.size()) {
      Usage();
      return kExitUsage;
    }
    const auto& flag  = args[i];
    const auto& value = args[i + 1];
    if (flag == "--metadata") {
      event.metadata = value;
    } else if (flag == "--correlation-id") {
      event.correlation_id = value;
    } else if (flag == "--causation-id") {
      event.causation_id = value;
    } else if (flag == "--user-id") {
      event.user_id = value;
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return kExitUsage;
    }
  }

  const auto expected  = ParseCount(args[2], "expected_version");
  const auto stream_id = deps.event_store->AppendEvents(args[0], args[1], expected, {event});

  chronicle::v1::AppendResult result;
  result.set_stream_id(stream_id);
  result.set_version(expected + 1);
  result.set_events_appended(1);
  Print(result);
  return 0;
}

int ListProducts(const chronicle::readmodel::ProductCatalog& catalog, const std::vector<std::string>& args) {
  chronicle::db::model::ProductQuery query;
  query.limit = 20;

  for (size_t i = 1; i < args.size(); ++i) {
    const auto& flag = args[i];
    if (flag == "--include-deleted") {
      query.include_deleted = true;
      continue;
    }
    if (i + 1 >= args.size()) {
      Usage();
      return kExitUsage;
    }
    const auto& value = args[++i];
    if (flag == "--status") {
      query.status = value;
    } else if (flag == "--min-price") {
      query.min_price_cents = ParseCents(value, "min-price");
    } else if (flag == "--max-price") {
      query.max_price_cents = ParseCents(value, "max-price");
    } else if (flag == "--sort") {
      query.sort = ParseSort(value);
    } else if (flag == "--limit") {
      query.limit = ParseCount(value, "limit");
    } else if (flag == "--offset") {
      query.offset = ParseCount(value, "offset");
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return kExitUsage;
    }
  }

  if (query.min_price_cents && query.max_price_cents && *query.min_price_cents > *query.max_price_cents) {
    throw chronicle::util::ValidationError("min-price is above max-price");
  }

  Print(chronicle::readmodel::ToProto(catalog.Query(query), catalog.Count(query)));
  return 0;
}

int ProductCommand(chronicle::factory::RuntimeDependencies& deps, const std::vector<std::string>& args) {
  if (args.empty()) {
    Usage();
    return kExitUsage;
  }
  const auto& sub     = args[0];
  const auto& catalog = *deps.catalog;

  if (sub == "list") return ListProducts(catalog, args);

  if (args.size() < 2) {
    Usage();
    return kExitUsage;
  }

  if (sub == "get" || sub == "by-sku") {
    auto product = sub == "get" ? catalog.Get(args[1]) : catalog.FindBySku(args[1]);
    if (!product) throw chronicle::util::NotFound("product not found: " + args[1]);
    Print(chronicle::readmodel::ToProto(*product));
    return 0;
  }

  if (sub == "search") {
    const uint64_t limit = args.size() >= 3 ? ParseCount(args[2], "limit") : 20;

    chronicle::db::model::ProductQuery query;
    query.search = args[1];
    Print(chronicle::readmodel::ToProto(catalog.Search(args[1], limit), catalog.Count(query)));
    return 0;
  }

  std::cerr << "unknown product command: " << sub << "\n";
  Usage();
  return kExitUsage;
}

int Run(chronicle::factory::RuntimeDependencies& deps, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "append") return Append(deps, args);
  if (cmd == "product") return ProductCommand(deps, args);

  if (cmd == "read-stream") {
    if (args.size() < 2) {
      Usage();
      return kExitUsage;
    }
    const uint64_t from = args.size() >= 3 ? ParseCount(args[2], "from_version") : 0;
    if (!deps.event_store->StreamExists(args[0], args[1])) {
      throw chronicle::util::NotFound("stream not found: " + args[0] + "/" + args[1]);
    }
    Print(chronicle::eventstore::ToProto(deps.event_store->ReadStream(args[0], args[1], from)));
    return 0;
  }

  if (cmd == "events-after") {
    if (args.empty()) {
      Usage();
      return kExitUsage;
    }
    std::optional<uint64_t> cursor;
    if (args[0] != "-") cursor = ParseCount(args[0], "cursor");
    const uint64_t limit = args.size() >= 2 ? ParseCount(args[1], "limit") : deps.projection_config.batch_size;
    Print(chronicle::eventstore::ToProto(deps.queries->EventsAfter(cursor, limit)));
    return 0;
  }

  if (cmd == "latest") {
    chronicle::v1::LatestSequence latest;
    if (auto seq = deps.queries->LatestSequence()) latest.set_global_sequence(*seq);
    Print(latest);
    return 0;
  }

  if (cmd == "status") {
    if (args.size() >= 1 && args[0] != deps.orchestrator->Name()) {
      throw chronicle::util::NotFound("projection not found: " + args[0]);
    }
    Print(chronicle::projection::ToProto(deps.runner->Status()));
    return 0;
  }

  if (cmd == "health") {
    auto health = deps.runner->Health();
    Print(chronicle::projection::ToProto(health));
    return health.healthy ? 0 : kExitProjection;
  }

  if (cmd == "catch-up") {
    chronicle::v1::CatchUpResult result;
    result.set_projection_name(deps.orchestrator->Name());
    result.set_events_applied(deps.orchestrator->ProcessToCaughtUp());
    Print(result);
    return 0;
  }

  if (cmd == "rebuild") {
    auto result = deps.runner->Rebuild();
    Print(chronicle::projection::ToProto(result));
    if (!result.success) {
      throw chronicle::util::RebuildError("rebuild of " + result.projection_name + " stopped after " +
                                          std::to_string(result.events_processed) + " events: " + result.error_message);
    }
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = chronicle::config::ConfigLoader::LoadFromYaml(config_path);
    chronicle::observability::InitializeLogging(config);

    auto deps = chronicle::factory::BuildRuntime(config);
    int  rc   = Run(deps, cmd, args);

    chronicle::observability::ShutdownLogging();
    return rc;
  } catch (const chronicle::util::ValidationError& e) {
    std::cerr << "invalid input: " << e.what() << "\n";
    return kExitValidation;
  } catch (const chronicle::util::ConcurrencyConflict& e) {
    std::cerr << e.what() << "\n";
    return kExitConflict;
  } catch (const chronicle::util::StorageError& e) {
    std::cerr << "storage error (" << chronicle::db::ToString(e.code()) << "): " << e.what() << "\n";
    return kExitStorage;
  } catch (const chronicle::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return kExitNotFound;
  } catch (const chronicle::util::RebuildError& e) {
    std::cerr << e.what() << "\n";
    return kExitProjection;
  } catch (const chronicle::util::ProjectionApplyError& e) {
    std::cerr << e.what() << "\n";
    return kExitProjection;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return kExitProjection;
  }
}
