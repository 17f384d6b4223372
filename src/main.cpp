#include <shelter/core/config.h>
#include <shelter/core/diagnostics.h>
#include <shelter/host/state_file.h>
#include <shelter/net/http_client.h>
#include <shelter/url/url.h>
#include <shelter/worker/control_channel.h>
#include <shelter/worker/push_dispatcher.h>
#include <shelter/worker/service_worker.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace {

constexpr const char kProgramName[] = "shelter";
constexpr const char kVersionString[] = "shelter 1.0.0";
constexpr const char kDefaultStatePath[] = "shelter.state";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <command> [--origin=URL] [--state=PATH] [--version=TAG] [--api-prefix=PREFIX]\n"
         << "commands:\n"
         << "  install\n"
         << "  activate\n"
         << "  fetch <url> [--navigate] [--method=M] [--body=TEXT]\n"
         << "  sync [tag]\n"
         << "  push [text]\n"
         << "  click [action]\n"
         << "  message <type>\n"
         << "  status\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

// "--name=value" -> value
std::optional<std::string> flag_value(std::string_view argument, std::string_view name) {
  if (!argument.starts_with(name) || argument.size() <= name.size() ||
      argument[name.size()] != '=') {
    return std::nullopt;
  }
  return std::string(argument.substr(name.size() + 1));
}

struct Options {
  std::string command;
  std::vector<std::string> positional;
  std::string state_path = kDefaultStatePath;
  bool navigate = false;
  std::string method = "GET";
  std::optional<std::string> body;
};

// Prints notifications instead of showing them.
class ConsoleNotifications : public shelter::worker::NotificationSurface {
 public:
  void show(const shelter::worker::NotificationRequest& notification) override {
    std::cout << "notification: " << notification.title << " - " << notification.body << "\n";
    for (const auto& action : notification.actions) {
      std::cout << "  [" << action.action << "] " << action.title << "\n";
    }
  }

  void close(const shelter::worker::NotificationRequest& notification) override {
    std::cout << "notification closed: " << notification.title << "\n";
  }
};

// A command line has no open windows; navigation intents are printed.
class ConsoleClients : public shelter::worker::ClientsSurface {
 public:
  explicit ConsoleClients(std::string origin) : origin_(std::move(origin)) {}

  void open_window(const shelter::worker::NavigationIntent& intent) override {
    auto target = shelter::worker::resolve_against_origin(origin_, intent.url);
    std::cout << "open window: " << target.value_or(intent.url) << "\n";
  }

  void claim(const std::string& cache_name) override {
    std::cout << "clients claimed by " << cache_name << "\n";
  }

  size_t clients_controlled_by_other(const std::string&) const override {
    return 0;
  }

 private:
  std::string origin_;
};

void print_response(const shelter::net::Response& response) {
  std::cout << response.status << " " << response.status_text << " ("
            << shelter::net::response_type_name(response.type) << ")\n";
  for (const auto& [name, value] : response.headers) {
    std::cout << name << ": " << value << "\n";
  }
  std::cout << "\n" << response.body_as_string() << "\n";
}

void print_status(shelter::worker::ServiceWorker& worker) {
  auto& storage = worker.cache_storage();
  std::cout << "state: " << shelter::worker::worker_state_name(worker.state()) << "\n"
            << "cache: " << worker.cache_name() << "\n"
            << "storage: " << storage.used_bytes() << " / " << storage.quota_bytes()
            << " bytes\n";
  for (const auto& name : storage.keys()) {
    auto cache = storage.get(name);
    if (!cache) {
      continue;
    }
    std::cout << "  " << name << " (" << cache->size() << " entries)\n";
    for (const auto& key : cache->keys()) {
      std::cout << "    " << key.str() << "\n";
    }
  }
  auto pending = worker.sync_queue().pending();
  std::cout << "pending sync actions: " << pending.size() << "\n";
  for (const auto& action : pending) {
    std::cout << "  " << action.id << " [" << action.tag << "] "
              << shelter::net::method_to_string(action.request.method) << " "
              << action.request.url << " (attempts " << action.attempts << ")\n";
  }
}

std::optional<shelter::worker::Event> build_event(const Options& options,
                                                  const shelter::core::EngineConfig& config) {
  using namespace shelter::worker;
  const auto& args = options.positional;

  if (options.command == "install") {
    return InstallEvent{};
  }
  if (options.command == "activate") {
    return ActivateEvent{};
  }
  if (options.command == "fetch") {
    if (args.empty()) {
      std::cerr << "fetch: missing url\n";
      return std::nullopt;
    }
    auto url = resolve_against_origin(config.origin, args[0]);
    if (!url) {
      std::cerr << "fetch: invalid url '" << args[0] << "'\n";
      return std::nullopt;
    }
    FetchEvent fetch;
    fetch.request.url = *url;
    fetch.request.method = shelter::net::string_to_method(options.method);
    if (options.body) {
      fetch.request.set_body(*options.body);
      fetch.request.headers.set("Content-Type", "application/json");
    }
    if (options.navigate) {
      fetch.mode = RequestMode::Navigate;
    } else {
      auto page = shelter::url::parse(config.origin);
      auto target = shelter::url::parse(*url);
      bool same = page && target && shelter::url::urls_same_origin(*page, *target);
      fetch.mode = same ? RequestMode::SameOrigin : RequestMode::NoCors;
    }
    return fetch;
  }
  if (options.command == "sync") {
    return SyncEvent{args.empty() ? config.sync_tag : args[0], false};
  }
  if (options.command == "push") {
    PushEvent push;
    if (!args.empty()) {
      push.data = args[0];
    }
    return push;
  }
  if (options.command == "click") {
    NotificationClickEvent click;
    click.notification =
        build_notification(config, std::nullopt, std::chrono::system_clock::now());
    click.action = args.empty() ? std::string() : args[0];
    return click;
  }
  if (options.command == "message") {
    if (args.empty()) {
      std::cerr << "message: missing type\n";
      return std::nullopt;
    }
    return MessageEvent{encode_control_message(ControlMessage{args[0], {}})};
  }

  std::cerr << "unknown command '" << options.command << "'\n";
  return std::nullopt;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << kVersionString << "\n";
    return 0;
  }

  shelter::core::EngineConfig config;
  Options options;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (auto value = flag_value(argument, "--origin")) {
      config.origin = *value;
    } else if (auto value = flag_value(argument, "--state")) {
      options.state_path = *value;
    } else if (auto value = flag_value(argument, "--version")) {
      config.cache_version = *value;
    } else if (auto value = flag_value(argument, "--api-prefix")) {
      config.api_prefix = *value;
    } else if (auto value = flag_value(argument, "--method")) {
      options.method = *value;
    } else if (auto value = flag_value(argument, "--body")) {
      options.body = *value;
    } else if (argument == "--navigate") {
      options.navigate = true;
    } else if (argument.starts_with("--")) {
      std::cerr << "Unknown flag '" << argument << "'\n";
      print_usage(std::cerr);
      return 1;
    } else if (options.command.empty()) {
      options.command = std::string(argument);
    } else {
      options.positional.emplace_back(argument);
    }
  }

  if (options.command.empty()) {
    print_usage(std::cerr);
    return 1;
  }
  if (!shelter::url::parse(config.origin)) {
    std::cerr << "Invalid --origin: '" << config.origin << "'\n";
    return 1;
  }

  shelter::core::DiagnosticEmitter diagnostics;
  diagnostics.add_observer(shelter::core::stream_observer(std::cerr));

  shelter::net::HttpClient http;
  http.set_timeout(std::chrono::milliseconds(config.network_timeout_ms));
  http.set_user_agent(shelter::core::config::kUserAgent);

  ConsoleNotifications notifications;
  ConsoleClients clients(config.origin);
  shelter::worker::ServiceWorker worker(config, http, notifications, clients, diagnostics);

  try {
    shelter::host::PersistedState saved;
    if (shelter::host::load_state_file(options.state_path, saved)) {
      shelter::host::apply_state(saved, worker);
    }
  } catch (const shelter::host::StateFileError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  int exit_code = 0;
  if (options.command == "status") {
    print_status(worker);
    return 0;
  }

  auto event = build_event(options, config);
  if (!event) {
    print_usage(std::cerr);
    return 1;
  }

  const bool is_fetch = std::holds_alternative<shelter::worker::FetchEvent>(*event);
  std::optional<shelter::net::Request> default_fetch;
  if (is_fetch) {
    default_fetch = std::get<shelter::worker::FetchEvent>(*event).request;
  }

  auto outcome = worker.dispatch_sync(std::move(*event));
  worker.wait_until_idle();

  if (!outcome.ok) {
    std::cerr << shelter::worker::event_kind_name(outcome.kind) << " failed: " << outcome.error
              << "\n";
    exit_code = 1;
  } else if (is_fetch) {
    if (outcome.response) {
      print_response(*outcome.response);
    } else {
      // Not controlling yet: behave like a page without a worker
      std::cout << "(not intercepted)\n";
      auto response = http.fetch(*default_fetch);
      if (response) {
        print_response(*response);
      } else {
        std::cerr << "network error\n";
        exit_code = 1;
      }
    }
  } else {
    std::cout << shelter::worker::event_kind_name(outcome.kind) << ": ok ("
              << shelter::worker::worker_state_name(worker.state()) << ")\n";
  }

  try {
    shelter::host::save_state_file(options.state_path, shelter::host::capture_state(worker));
  } catch (const shelter::host::StateFileError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return exit_code;
}
