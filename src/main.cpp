#include "stdinc.hpp"

#include "voltwire/client.hpp"
#include "voltwire/utils/cli-utils.hpp"

namespace voltwire {

struct Config {
  client::Connection::Config connection;
  bool show_help = false;
  bool has_error = false;
};

// ------------------------------------------------------------------------------------ show_help

static void show_help(const char* argv0) {
  cout << fmt::format(R"V0G0N(

   Usage: {} [--host <host>] [--port <port>] [--user <user>] [--password <password>]

      Inserts five greetings into HELLOWORLD, then selects and prints the French one.
      Defaults to localhost:21212, with an empty user and password.

)V0G0N",
                      argv0);
}

// --------------------------------------------------------------------------- parse_command_line

static Config parse_command_line(int argc, char** argv) {
  Config conf;

  for (int i = 1; i < argc; ++i) {
    auto arg = string_view(argv[i]);
    if (arg == "-h" || arg == "--help") {
      conf.show_help = true;
      return conf; // no need to look at other switches
    }
  }

  try {
    for (int i = 1; i < argc; ++i) {
      auto arg = string_view(argv[i]);
      if (arg == "--host") {
        conf.connection.host = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--port") {
        conf.connection.port = cli::safe_arg_port(argc, argv, i);
      } else if (arg == "--user") {
        conf.connection.user = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--password") {
        conf.connection.password = cli::safe_arg_str(argc, argv, i);
      } else {
        LOG_ERR("unexpected argument: '{}'", arg);
        conf.has_error = true;
      }
    }
  } catch (std::runtime_error& e) {
    LOG_ERR("{}", e.what());
    conf.has_error = true;
  }

  return conf;
}

// ------------------------------------------------------------------------------------------ run

static int run(const Config& conf) {
  auto conn = client::Connection::open(conf.connection);
  if (!conn) {
    LOG_ERR("failed to connect to {}:{}: {}", conf.connection.host, conf.connection.port,
            conn.error().to_string());
    return EXIT_FAILURE;
  }

  const std::array<std::array<const char*, 3>, 5> rows{{{"Hello", "World", "English"},
                                                        {"Bonjour", "Monde", "French"},
                                                        {"Hola", "Mundo", "Spanish"},
                                                        {"Hej", "Verden", "Danish"},
                                                        {"Ciao", "Mondo", "Italian"}}};
  for (const auto& row : rows) {
    auto future =
        conn->call_async("HELLOWORLD.insert", {string{row[0]}, string{row[1]}, string{row[2]}});
    if (!future) {
      LOG_ERR("insert failed: {}", future.error().to_string());
      return EXIT_FAILURE;
    }
  }

  auto select = conn->call_async("HELLOWORLD.select", {string{"French"}});
  if (!select) {
    LOG_ERR("select failed: {}", select.error().to_string());
    return EXIT_FAILURE;
  }

  for (const auto& future : conn->drain_all()) {
    if (const auto& result = future->get(); !result) {
      LOG_ERR("call with handle {} failed: {}", future->handle(), result.error().to_string());
      return EXIT_FAILURE;
    }
  }

  const auto& response = *(*select)->get();
  if (response.table_count() == 0 || response.table(0).row_count() == 0) {
    LOG_ERR("select statement didn't return any data");
    return EXIT_FAILURE;
  }

  const auto row = response.table(0).row(0);
  const auto hello = row.get_string("HELLO");
  const auto world = row.get_string("WORLD");
  if (!hello || !world) {
    LOG_ERR("could not read greeting: {}", (!hello ? hello.error() : world.error()).message());
    return EXIT_FAILURE;
  }
  if (!hello->has_value() || !world->has_value()) {
    LOG_ERR("unexpected null values");
    return EXIT_FAILURE;
  }

  cout << fmt::format("{}, {}!", **hello, **world) << endl;

  if (auto status = conn->close(); !status.ok()) {
    LOG_ERR("closing connection: {}", status.to_string());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
  auto conf = parse_command_line(argc, argv);
  if (conf.has_error) {
    cerr << "Aborting due to previous errors..." << endl;
    return EXIT_FAILURE;
  }
  if (conf.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  conf.connection.handles = std::make_shared<async::HandleAllocator>();
  return run(conf);
}

} // namespace voltwire

int main(int argc, char** argv) { return voltwire::main(argc, argv); }
