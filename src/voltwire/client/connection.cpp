#include "stdinc.hpp"

#include "connection.hpp"
#include "drain.hpp"
#include "network-listener.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <mutex>
#include <type_traits>

namespace voltwire::client {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using net::Status;
using net::StatusCode;

// ---------------------------------------------------------------------------- OutstandingTable

namespace {
/**
 * Async futures that have not yet been consumed. Futures erase themselves (through a
 * consumer hook) when consumed, so the hook holds a weak pointer to the table.
 */
struct OutstandingTable {
  mutable std::mutex padlock;
  std::unordered_map<Handle, QueryFuturePtr> queries;
  std::unordered_map<Handle, ExecFuturePtr> execs;

  template <typename FutureType> auto& map() {
    if constexpr (std::is_same_v<FutureType, QueryFuture>)
      return queries;
    else
      return execs;
  }

  template <typename FutureType> void insert(const std::shared_ptr<FutureType>& future) {
    std::lock_guard lock{padlock};
    map<FutureType>().insert_or_assign(future->handle(), future);
  }

  template <typename FutureType> void erase(Handle handle) {
    std::lock_guard lock{padlock};
    map<FutureType>().erase(handle);
  }

  template <typename FutureType> std::vector<std::shared_ptr<FutureType>> snapshot() {
    std::vector<std::shared_ptr<FutureType>> out;
    {
      std::lock_guard lock{padlock};
      out = map<FutureType>() | views::values | ranges::to<std::vector>();
    }
    ranges::sort(out, std::less<>{}, [](const auto& future) { return future->handle(); });
    return out;
  }
};
} // namespace

// ----------------------------------------------------------------------------------------- Pimpl

struct Connection::Pimpl {
  Config config;
  asio::io_context io_context{};
  tcp::socket socket{io_context};
  wire::LoginData login_data{};
  std::unique_ptr<NetworkListener<tcp::socket>> listener{};
  std::atomic<bool> is_open{false};
  std::mutex write_padlock{};
  std::shared_ptr<OutstandingTable> outstanding{std::make_shared<OutstandingTable>()};

  explicit Pimpl(Config config_) : config{std::move(config_)} {}
  Pimpl(const Pimpl&) = delete;
  Pimpl& operator=(const Pimpl&) = delete;

  ~Pimpl() {
    if (is_open.load(std::memory_order_acquire)) {
      const auto status = close();
      if (!status.ok())
        WARN("error closing connection: {}", status.to_string());
    }
  }

  std::string endpoint() const { return fmt::format("{}:{}", config.host, config.port); }

  Status close();

  template <typename FutureType>
  expected<std::shared_ptr<FutureType>, Status> issue(std::string_view procedure,
                                                      const Args& args, bool track);

  template <typename FutureType> void track(const std::shared_ptr<FutureType>& future) {
    outstanding->insert(future);
    future->set_consumer([weak = std::weak_ptr<OutstandingTable>{outstanding}](Handle handle) {
      if (auto table = weak.lock())
        table->template erase<FutureType>(handle);
    });
  }
};

// ----------------------------------------------------------------------------------------- close

Status Connection::Pimpl::close() {
  if (!is_open.exchange(false, std::memory_order_acq_rel))
    return Status{StatusCode::CONNECTION_CLOSED, "connection is already closed"};

  // Every pending future is resolved before the listener thread exits
  listener->stop();

  // Fails any write blocked on a full send buffer, which holds the write lock
  boost::system::error_code ec;
  socket.shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != asio::error::not_connected)
    LOG_DEBUG("shutdown(send) failed: {}", ec.message());

  ec.clear();
  {
    std::lock_guard lock{write_padlock};
    socket.close(ec);
  }

  const auto stats = listener->stats();
  INFO("closed connection to {} ({} delivered, {} orphaned)", endpoint(), stats.delivered,
       stats.orphaned);

  if (ec)
    return Status{StatusCode::IO_ERROR, "failed to close socket", ec.message()};
  return {};
}

// ----------------------------------------------------------------------------------------- issue

template <typename FutureType>
expected<std::shared_ptr<FutureType>, Status>
Connection::Pimpl::issue(std::string_view procedure, const Args& args, bool should_track) {
  if (!is_open.load(std::memory_order_acquire))
    return make_unexpected(Status{StatusCode::CONNECTION_CLOSED, "connection is not open"});

  const auto handle = config.handles->next();

  net::BufferType buffer;
  if (auto ec = wire::serialize_statement(buffer, procedure, handle, args); ec)
    return make_unexpected(Status{StatusCode::SERIALIZATION_ERROR,
                                  fmt::format("could not serialize call to '{}'", procedure),
                                  ec.message()});

  auto future = std::make_shared<FutureType>(handle);
  bool is_registered = false;
  if constexpr (std::is_same_v<FutureType, QueryFuture>)
    is_registered = listener->register_query(future);
  else
    is_registered = listener->register_exec(future);
  if (!is_registered)
    return make_unexpected(
        Status{StatusCode::CONNECTION_LOST, "the network listener has stopped"});

  if (should_track)
    track(future);

  error_code ec;
  {
    std::lock_guard lock{write_padlock};
    ec = is_open.load(std::memory_order_acquire)
             ? net::write_frame(socket, net::to_span_bytes(buffer))
             : make_error_code(ecode::stream_closed);
  }

  if (ec) {
    listener->remove(handle);
    outstanding->erase<FutureType>(handle);
    return make_unexpected(Status{StatusCode::SEND_ERROR,
                                  fmt::format("failed to send '{}' (handle {})", procedure, handle),
                                  ec.message()});
  }

  TRACE("sent '{}', handle {}, {} bytes", procedure, handle, buffer.size());
  return future;
}

// ---------------------------------------------------------------------------------- construction

Connection::Connection(std::unique_ptr<Pimpl> pimpl) : pimpl_{std::move(pimpl)} {}
Connection::Connection(Connection&&) noexcept = default;
Connection::~Connection() = default;
Connection& Connection::operator=(Connection&&) noexcept = default;

// ------------------------------------------------------------------------------------------ open

expected<Connection, Status> Connection::open(Config config) {
  if (config.handles == nullptr)
    return make_unexpected(Status{StatusCode::CONNECT_ERROR, "no handle allocator configured"});

  auto pimpl = std::make_unique<Pimpl>(std::move(config));
  const auto& cfg = pimpl->config;
  auto& socket = pimpl->socket;
  boost::system::error_code ec;

  { // Resolve and dial
    tcp::resolver resolver{pimpl->io_context};
    const auto endpoints = resolver.resolve(cfg.host, std::to_string(cfg.port), ec);
    if (ec)
      return make_unexpected(Status{StatusCode::CONNECT_ERROR,
                                    fmt::format("could not resolve '{}'", cfg.host),
                                    ec.message()});
    asio::connect(socket, endpoints, ec);
    if (ec)
      return make_unexpected(Status{StatusCode::CONNECT_ERROR,
                                    fmt::format("could not connect to {}", pimpl->endpoint()),
                                    ec.message()});
  }

  socket.set_option(tcp::no_delay{true}, ec);
  if (ec)
    LOG_DEBUG("could not set TCP_NODELAY: {}", ec.message());

  { // Login handshake
    net::BufferType buffer;
    if (auto err = wire::serialize_login_message(buffer, cfg.user, cfg.password); err)
      return make_unexpected(
          Status{StatusCode::SERIALIZATION_ERROR, "could not serialize login", err.message()});
    if (auto err = net::write_login_frame(socket, net::to_span_bytes(buffer)); err)
      return make_unexpected(
          Status{StatusCode::CONNECT_ERROR, "could not send login", err.message()});

    if (auto err = net::read_frame(socket, buffer, cfg.max_frame_size); err)
      return make_unexpected(
          Status{StatusCode::PROTOCOL_ERROR, "could not read login response", err.message()});

    auto login_data = wire::deserialize_login_response(net::to_span_bytes(buffer));
    if (!login_data && login_data.error() == ecode::authentication_rejected)
      return make_unexpected(Status{StatusCode::AUTHENTICATION_FAILED,
                                    fmt::format("login rejected for user '{}'", cfg.user)});
    if (!login_data)
      return make_unexpected(Status{StatusCode::PROTOCOL_ERROR,
                                    "could not decode login response",
                                    login_data.error().message()});
    pimpl->login_data = std::move(*login_data);
  }

  pimpl->listener = std::make_unique<NetworkListener<tcp::socket>>(socket, cfg.max_frame_size);
  pimpl->listener->start();
  pimpl->is_open.store(true, std::memory_order_release);

  INFO("connected to {}, host-id={}, connection-id={}, leader={}, build='{}'", pimpl->endpoint(),
       pimpl->login_data.host_id, pimpl->login_data.connection_id,
       pimpl->login_data.leader_address_string(), pimpl->login_data.build_string);

  return Connection{std::move(pimpl)};
}

// ----------------------------------------------------------------------------------------- close

Status Connection::close() {
  if (pimpl_ == nullptr)
    return Status{StatusCode::CONNECTION_CLOSED, "connection is already closed"};
  return pimpl_->close();
}

bool Connection::is_open() const {
  return pimpl_ != nullptr && pimpl_->is_open.load(std::memory_order_acquire);
}

// ----------------------------------------------------------------------------------------- calls

expected<wire::Response, Status> Connection::call(std::string_view procedure, const Args& args) {
  if (pimpl_ == nullptr)
    return make_unexpected(Status{StatusCode::CONNECTION_CLOSED, "connection is not open"});
  auto future = pimpl_->issue<QueryFuture>(procedure, args, false);
  if (!future)
    return make_unexpected(std::move(future.error()));
  return (*future)->get();
}

expected<wire::ExecResult, Status> Connection::exec(std::string_view procedure,
                                                    const Args& args) {
  if (pimpl_ == nullptr)
    return make_unexpected(Status{StatusCode::CONNECTION_CLOSED, "connection is not open"});
  auto future = pimpl_->issue<ExecFuture>(procedure, args, false);
  if (!future)
    return make_unexpected(std::move(future.error()));
  return (*future)->get();
}

expected<QueryFuturePtr, Status> Connection::call_async(std::string_view procedure,
                                                        const Args& args) {
  if (pimpl_ == nullptr)
    return make_unexpected(Status{StatusCode::CONNECTION_CLOSED, "connection is not open"});
  return pimpl_->issue<QueryFuture>(procedure, args, true);
}

expected<ExecFuturePtr, Status> Connection::exec_async(std::string_view procedure,
                                                       const Args& args) {
  if (pimpl_ == nullptr)
    return make_unexpected(Status{StatusCode::CONNECTION_CLOSED, "connection is not open"});
  return pimpl_->issue<ExecFuture>(procedure, args, true);
}

// ----------------------------------------------------------------------------------------- drain

void Connection::drain(std::span<const QueryFuturePtr> futures) {
  [[maybe_unused]] const auto waited = ::voltwire::client::drain(futures);
  TRACE("drained {} future(s), waited on {}", futures.size(), waited);
}

std::vector<QueryFuturePtr> Connection::drain_all() {
  auto futures = outstanding_queries();
  drain(futures);
  return futures;
}

std::vector<QueryFuturePtr> Connection::outstanding_queries() const {
  if (pimpl_ == nullptr)
    return {};
  return pimpl_->outstanding->snapshot<QueryFuture>();
}

std::vector<ExecFuturePtr> Connection::outstanding_execs() const {
  if (pimpl_ == nullptr)
    return {};
  return pimpl_->outstanding->snapshot<ExecFuture>();
}

// -------------------------------------------------------------------------------------- getters

const wire::LoginData& Connection::login_data() const {
  static const wire::LoginData k_no_login_data{};
  if (pimpl_ == nullptr)
    return k_no_login_data;
  return pimpl_->login_data;
}

uint64_t Connection::orphaned_responses() const {
  if (pimpl_ == nullptr || pimpl_->listener == nullptr)
    return 0;
  return pimpl_->listener->stats().orphaned;
}

} // namespace voltwire::client
