#include "fake-volt-server.hpp"

#include "voltwire/net/framing.hpp"
#include "voltwire/wire/primitives.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <stdexcept>

namespace voltwire::testing {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using net::BufferType;

static void check(error_code ec, std::string_view what) {
  if (ec)
    throw std::runtime_error(fmt::format("{}: {}", what, ec.message()));
}

// ------------------------------------------------------------------------------- server encoders

static void encode_cell(BufferType& out, wire::WireType type, const wire::Value& value) {
  using wire::WireType;
  if (wire::is_null(value)) {
    switch (type) {
    case WireType::TINYINT:
      wire::write_i8(out, wire::k_null_tinyint);
      break;
    case WireType::SMALLINT:
      wire::write_i16(out, wire::k_null_smallint);
      break;
    case WireType::INTEGER:
      wire::write_i32(out, wire::k_null_integer);
      break;
    case WireType::BIGINT:
    case WireType::TIMESTAMP:
      wire::write_i64(out, wire::k_null_bigint);
      break;
    case WireType::FLOAT:
      wire::write_f64(out, wire::k_null_float);
      break;
    case WireType::STRING:
    case WireType::VARBINARY:
      wire::write_null_string(out);
      break;
    default:
      throw std::runtime_error(fmt::format("cannot encode a null {}", str(type)));
    }
    return;
  }

  // A cell is a parameter without its leading type byte
  BufferType parameter;
  check(wire::serialize_value(parameter, value), "encode cell");
  wire::write_raw(out, std::span<const std::byte>{parameter}.subspan(1));
}

void encode_table(BufferType& out, const wire::Table& table) {
  BufferType metadata;
  wire::write_i8(metadata, table.status());
  wire::write_i16(metadata, int16_t(table.column_count()));
  for (const auto& column : table.columns())
    wire::write_i8(metadata, int8_t(column.type));
  for (const auto& column : table.columns())
    check(wire::write_string(metadata, column.name), "encode column name");

  BufferType body;
  wire::write_i32(body, int32_t(metadata.size()));
  wire::write_raw(body, metadata);
  wire::write_i32(body, int32_t(table.row_count()));
  for (std::size_t i = 0; i < table.row_count(); ++i) {
    BufferType row;
    const auto& values = table.values(i);
    for (std::size_t j = 0; j < values.size(); ++j)
      encode_cell(row, table.columns().at(j).type, values[j]);
    wire::write_i32(body, int32_t(row.size()));
    wire::write_raw(body, row);
  }

  wire::write_i32(out, int32_t(body.size()));
  wire::write_raw(out, body);
}

BufferType encode_response(Handle handle, wire::ResponseStatus status,
                           const std::vector<wire::Table>& tables,
                           std::optional<std::string> status_string) {
  BufferType out;
  wire::write_i8(out, 0); // version
  wire::write_i64(out, handle);
  wire::write_i8(out, int8_t(status_string.has_value() ? 0x20 : 0x00));
  wire::write_i8(out, int8_t(status));
  if (status_string)
    check(wire::write_string(out, *status_string), "encode status string");
  wire::write_i8(out, int8_t(wire::ResponseStatus::UNINITIALIZED_APP_STATUS));
  wire::write_i32(out, 1); // cluster round trip
  wire::write_i16(out, int16_t(tables.size()));
  for (const auto& table : tables)
    encode_table(out, table);
  return out;
}

BufferType encode_login_response(int8_t auth_code, const wire::LoginData& data) {
  BufferType out;
  wire::write_i8(out, data.version);
  wire::write_i8(out, auth_code);
  wire::write_i32(out, data.host_id);
  wire::write_i64(out, data.connection_id);
  wire::write_i64(out, data.cluster_start_timestamp);
  for (auto octet : data.leader_address)
    wire::write_i8(out, int8_t(octet));
  check(wire::write_string(out, data.build_string), "encode build string");
  return out;
}

tl::expected<Invocation, error_code> decode_invocation(std::span<const std::byte> payload) {
  wire::ByteReader in{payload};
  Invocation invocation;
  int8_t version = 0;
  int16_t count = 0;

  error_code ec = wire::read_i8(in, version);
  if (!ec)
    ec = wire::read_string(in, invocation.procedure);
  if (!ec)
    ec = wire::read_i64(in, invocation.handle);
  if (!ec)
    ec = wire::read_i16(in, count);
  if (ec)
    return tl::make_unexpected(ec);

  for (int16_t i = 0; i < count; ++i) {
    int8_t type = 0;
    if (auto err = wire::read_i8(in, type); err)
      return tl::make_unexpected(err);
    auto value = wire::decode_value(in, wire::WireType(type));
    if (!value)
      return tl::make_unexpected(value.error());
    invocation.args.push_back(std::move(*value));
  }

  if (!in.empty())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  return invocation;
}

// ---------------------------------------------------------------------------------- FakeVoltServer

struct FakeVoltServer::Pimpl {
  Config config;
  asio::io_context io_context{};
  tcp::acceptor acceptor{io_context};
  uint16_t port{0};
  std::thread thread{};

  mutable std::mutex padlock{};
  std::condition_variable cv{};
  bool is_stopping{false};
  bool is_dropped{false};     // the current connection was disconnected or reset
  bool is_reset{false};
  tcp::socket* current{nullptr};
  std::size_t connections{0};
  std::vector<Handle> handles{};
  std::vector<Greeting> greetings{};
  int64_t next_connection_id{1};

  explicit Pimpl(Config config_) : config{std::move(config_)} {
    const tcp::endpoint endpoint{asio::ip::make_address("127.0.0.1"), 0};
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();
    port = acceptor.local_endpoint().port();
  }

  void run();
  void serve(tcp::socket& socket);
  void stall(tcp::socket& socket);
  bool login(tcp::socket& socket);
  std::vector<BufferType> respond(const Invocation& invocation);
  void shutdown_current_locked();
};

void FakeVoltServer::Pimpl::shutdown_current_locked() {
  if (current == nullptr)
    return;
  boost::system::error_code ec;
  current->shutdown(tcp::socket::shutdown_both, ec);
  if (ec)
    LOG_DEBUG("fake server shutdown: {}", ec.message());
}

void FakeVoltServer::Pimpl::run() {
  while (true) {
    tcp::socket socket{io_context};
    boost::system::error_code ec;
    acceptor.accept(socket, ec);
    if (ec) {
      WARN("fake server accept failed: {}", ec.message());
      return;
    }

    {
      std::lock_guard lock{padlock};
      if (is_stopping)
        return;
      current = &socket;
      is_dropped = false;
      is_reset = false;
      ++connections;
    }

    serve(socket);

    {
      std::lock_guard lock{padlock};
      current = nullptr;
    }
    socket.close(ec);
  }
}

bool FakeVoltServer::Pimpl::login(tcp::socket& socket) {
  BufferType payload;
  if (auto ec = net::read_frame(socket, payload); ec)
    return false;

  // Skip the protocol and password-hash version bytes
  BufferType expected;
  check(wire::serialize_login_message(expected, config.user, config.password), "login");
  const bool credentials_match =
      payload.size() >= 2 &&
      std::equal(payload.begin() + 2, payload.end(), expected.begin(), expected.end());
  const bool is_accepted = credentials_match && !config.reject_login;

  wire::LoginData data;
  data.version = 0;
  data.host_id = 0;
  data.cluster_start_timestamp = 1'700'000'000'000;
  data.leader_address = {127, 0, 0, 1};
  data.build_string = config.build_string;
  {
    std::lock_guard lock{padlock};
    data.connection_id = next_connection_id++;
  }

  const auto response = encode_login_response(is_accepted ? 0 : 1, data);
  if (auto ec = net::write_frame(socket, net::to_span_bytes(response)); ec)
    return false;
  return is_accepted;
}

std::vector<BufferType> FakeVoltServer::Pimpl::respond(const Invocation& invocation) {
  using wire::Column;
  using wire::ResponseStatus;
  using wire::WireType;

  const auto& args = invocation.args;
  const auto all_strings =
      ranges::all_of(args, [](const auto& arg) { return std::holds_alternative<string>(arg); });

  if (invocation.procedure == "HELLOWORLD.insert" && args.size() == 3 && all_strings) {
    {
      std::lock_guard lock{padlock};
      greetings.push_back({std::get<string>(args[0]), std::get<string>(args[1]),
                           std::get<string>(args[2])});
    }
    wire::Table table{0, {Column{"modified_tuples", WireType::BIGINT}}, {{wire::Value{int64_t{1}}}}};
    return {encode_response(invocation.handle, ResponseStatus::SUCCESS, {table})};
  }

  if (invocation.procedure == "HELLOWORLD.select" && args.size() == 1 && all_strings) {
    std::vector<std::vector<wire::Value>> rows;
    {
      std::lock_guard lock{padlock};
      for (const auto& greeting : greetings)
        if (greeting.dialect == std::get<string>(args[0]))
          rows.push_back({greeting.hello, greeting.world, greeting.dialect});
    }
    wire::Table table{0,
                      {Column{"HELLO", WireType::STRING}, Column{"WORLD", WireType::STRING},
                       Column{"DIALECT", WireType::STRING}},
                      std::move(rows)};
    return {encode_response(invocation.handle, ResponseStatus::SUCCESS, {table})};
  }

  if (invocation.procedure == "@NoReply")
    return {};

  if (invocation.procedure == "@Orphan")
    return {encode_response(invocation.handle + 1'000'000, ResponseStatus::SUCCESS),
            encode_response(invocation.handle, ResponseStatus::SUCCESS)};

  return {encode_response(invocation.handle, ResponseStatus::GRACEFUL_FAILURE, {},
                          fmt::format("Procedure {} was not found", invocation.procedure))};
}

void FakeVoltServer::Pimpl::stall(tcp::socket& socket) {
  std::unique_lock lock{padlock};
  cv.wait(lock, [this]() { return is_stopping || is_dropped; });
  if (!is_reset)
    return;

  // Unread requests are discarded; the client sees ECONNRESET
  boost::system::error_code ec;
  socket.set_option(asio::socket_base::linger{true, 0}, ec);
  if (!ec)
    socket.close(ec);
  if (ec)
    WARN("fake server could not reset connection: {}", ec.message());
}

void FakeVoltServer::Pimpl::serve(tcp::socket& socket) {
  if (!login(socket))
    return;

  if (config.stall_reads) {
    stall(socket);
    return;
  }

  std::vector<BufferType> held;
  BufferType payload;
  while (true) {
    if (auto ec = net::read_frame(socket, payload); ec)
      return; // client closed, or we were disconnected

    auto invocation = decode_invocation(payload);
    if (!invocation) {
      WARN("fake server could not decode invocation: {}", invocation.error().message());
      return;
    }

    {
      std::lock_guard lock{padlock};
      handles.push_back(invocation->handle);
    }

    for (auto& response : respond(*invocation))
      held.push_back(std::move(response));
    if (held.size() < std::max<std::size_t>(1, config.reverse_batch))
      continue;
    if (config.reverse_batch > 0)
      ranges::reverse(held);

    for (const auto& response : held)
      if (auto ec = net::write_frame(socket, net::to_span_bytes(response)); ec)
        return;
    held.clear();
  }
}

FakeVoltServer::FakeVoltServer(Config config)
    : pimpl_{std::make_unique<Pimpl>(std::move(config))} {
  pimpl_->thread = std::thread{[this]() { pimpl_->run(); }};
}

FakeVoltServer::~FakeVoltServer() { stop(); }

uint16_t FakeVoltServer::port() const { return pimpl_->port; }

void FakeVoltServer::disconnect() {
  {
    std::lock_guard lock{pimpl_->padlock};
    pimpl_->is_dropped = true;
    pimpl_->shutdown_current_locked();
  }
  pimpl_->cv.notify_all();
}

void FakeVoltServer::reset() {
  {
    std::lock_guard lock{pimpl_->padlock};
    pimpl_->is_dropped = true;
    pimpl_->is_reset = true;
  }
  pimpl_->cv.notify_all();
}

void FakeVoltServer::stop() {
  if (!pimpl_->thread.joinable())
    return;

  {
    std::lock_guard lock{pimpl_->padlock};
    pimpl_->is_stopping = true;
    pimpl_->shutdown_current_locked();
  }
  pimpl_->cv.notify_all();

  { // Wake the blocking accept
    boost::system::error_code ec;
    tcp::socket waker{pimpl_->io_context};
    waker.connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), pimpl_->port}, ec);
    if (ec)
      WARN("could not wake fake server: {}", ec.message());
    pimpl_->thread.join();
  }

  boost::system::error_code ec;
  pimpl_->acceptor.close(ec);
}

std::size_t FakeVoltServer::connections_accepted() const {
  std::lock_guard lock{pimpl_->padlock};
  return pimpl_->connections;
}

std::size_t FakeVoltServer::requests_received() const {
  std::lock_guard lock{pimpl_->padlock};
  return pimpl_->handles.size();
}

std::vector<Handle> FakeVoltServer::handles_received() const {
  std::lock_guard lock{pimpl_->padlock};
  return pimpl_->handles;
}

std::vector<FakeVoltServer::Greeting> FakeVoltServer::greetings() const {
  std::lock_guard lock{pimpl_->padlock};
  return pimpl_->greetings;
}

} // namespace voltwire::testing
