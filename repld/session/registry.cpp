#include "session/registry.hpp"
#include <new>
#include <stdexcept>

namespace repld::session {

registry_link_c::registry_link_c(session_registry_c *registry)
    : registry_(registry) {}

void registry_link_c::death_ind(const std::size_t tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (registry_) {
    registry_->on_handle_death(tag);
  }
}

void registry_link_c::detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  registry_ = nullptr;
}

session_handle_c::session_handle_c(id_t id, std::int32_t port,
                                   std::shared_ptr<registry_link_c> link,
                                   std::size_t serial)
    : id_(id), port_(port), link_(std::move(link)), lifetime_(*link_, serial) {
}

id_t session_handle_c::get_id() const { return id_; }

std::int32_t session_handle_c::get_port() const { return port_; }

session_c::session_c(id_t id, std::int32_t port) : id_(id), port_(port) {}

id_t session_c::get_id() const { return id_; }

std::int32_t session_c::get_port() const { return port_; }

std::optional<std::size_t> session_c::get_handle_serial() const {
  return handle_serial_;
}

engine::compilation_state_if &session_c::get_state() { return *state_; }

session_registry_c::session_registry_c(state_factory_t factory,
                                       logger_t logger,
                                       std::optional<std::uint64_t> seed)
    : session_registry_c(std::move(factory), logger,
                         std::make_shared<ids::id_allocator_c>(0, seed)) {}

session_registry_c::session_registry_c(
    state_factory_t factory, logger_t logger,
    std::shared_ptr<ids::id_allocator_c> allocator)
    : logger_(logger), factory_(std::move(factory)),
      allocator_(std::move(allocator)),
      link_(std::make_shared<registry_link_c>(this)), next_serial_(0) {
  if (!allocator_) {
    throw std::invalid_argument("session registry requires an id allocator");
  }
}

session_registry_c::~session_registry_c() {
  link_->detach();

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!sessions_.empty()) {
    logger_->info("[session_registry] Dropping {} live session(s)",
                  sessions_.size());
  }
  sessions_.clear();
  serial_to_id_.clear();
}

session_handle_t session_registry_c::create(std::int32_t port) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  const id_t id = allocator_->next_id(
      [this](id_t candidate) { return sessions_.count(candidate) == 0; });

  auto session = std::make_unique<session_c>(id, port);
  session->state_ = factory_(session->state_lock_);
  if (!session->state_) {
    throw engine::illegal_state_exception(
        fmt::format("no state was created for session {}", id));
  }

  const std::size_t serial = next_serial_++;
  session->handle_serial_ = serial;
  sessions_.emplace(id, std::move(session));

  // Constructed last: a handle dying here would need the lock we hold
  session_handle_c *handle = nullptr;
  try {
    serial_to_id_.emplace(serial, id);
    handle = new session_handle_c(id, port, link_, serial);
  } catch (const std::bad_alloc &) {
    serial_to_id_.erase(serial);
    sessions_.erase(id);
    logger_->error("[session_registry] Out of memory creating session {}", id);
    throw;
  }

  logger_->info("[session_registry] Created session {} (port {}, {} live)", id,
                port, sessions_.size());

  return session_handle_t(handle);
}

bool session_registry_c::remove(id_t id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return false;
  }

  if (auto serial = it->second->get_handle_serial()) {
    serial_to_id_.erase(*serial);
  }
  sessions_.erase(it);

  logger_->info("[session_registry] Removed session {} ({} live)", id,
                sessions_.size());
  return true;
}

void session_registry_c::on_handle_death(std::size_t serial) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = serial_to_id_.find(serial);
  if (it == serial_to_id_.end()) {
    return;
  }

  const id_t id = it->second;
  serial_to_id_.erase(it);
  sessions_.erase(id);

  logger_->info("[session_registry] Session {} released by its last handle "
                "({} live)",
                id, sessions_.size());
}

bool session_registry_c::contains(id_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.find(id) != sessions_.end();
}

std::size_t session_registry_c::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<id_t> session_registry_c::ids() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<id_t> result;
  result.reserve(sessions_.size());
  for (const auto &entry : sessions_) {
    result.push_back(entry.first);
  }
  return result;
}

} // namespace repld::session
