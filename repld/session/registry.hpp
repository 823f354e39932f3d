#pragma once

#include <engine/engine.hpp>
#include <fmt/core.h>
#include <functional>
#include <ids/id_allocator.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <session/call_result.hpp>
#include <shared_mutex>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <types/lifetime.hpp>
#include <types/shared_obj.hpp>
#include <vector>

namespace repld::session {

using logger_t = spdlog::logger *;
using id_t = ids::id_t;

class session_registry_c;

/*
  Relays handle deaths to the registry. Handles keep the link alive, so a
  handle outliving its registry finds the link detached instead of a
  dangling registry.
*/
class registry_link_c : public types::lifetime_tagged_c::observer_if {
public:
  explicit registry_link_c(session_registry_c *registry);

  void death_ind(const std::size_t tag) override;
  void detach();

private:
  std::mutex mutex_;
  session_registry_c *registry_;
};

//! \brief What a client holds on to. Releasing the last reference
//!        removes the session it names.
class session_handle_c : public types::shared_c {
public:
  session_handle_c(id_t id, std::int32_t port,
                   std::shared_ptr<registry_link_c> link, std::size_t serial);
  ~session_handle_c() override = default;

  id_t get_id() const;
  std::int32_t get_port() const;

private:
  id_t id_;
  std::int32_t port_;
  std::shared_ptr<registry_link_c> link_;
  types::lifetime_tagged_c lifetime_;
};

using session_handle_t = types::shared_obj_c<session_handle_c>;

class session_c {
public:
  session_c(const session_c &) = delete;
  session_c &operator=(const session_c &) = delete;

  session_c(id_t id, std::int32_t port);
  ~session_c() = default;

  id_t get_id() const;
  std::int32_t get_port() const;
  std::optional<std::size_t> get_handle_serial() const;
  engine::compilation_state_if &get_state();

private:
  friend class session_registry_c;

  id_t id_;
  std::int32_t port_;
  std::optional<std::size_t> handle_serial_;
  std::shared_mutex state_lock_;
  engine::compilation_state_t state_;
};

/*
  Owns every live session. Membership is guarded by one readers-writer
  lock: lookups share it, create/remove take it exclusively. Calls on the
  same session are not serialized here; the per-session lock handed to
  the state factory is the state's to use.

  Dropping a handle from inside a with_session body on the same thread
  deadlocks, since removal needs the exclusive lock.
*/
class session_registry_c {
public:
  using state_factory_t =
      std::function<engine::compilation_state_t(std::shared_mutex &)>;

  session_registry_c(const session_registry_c &) = delete;
  session_registry_c(session_registry_c &&) = delete;
  session_registry_c &operator=(const session_registry_c &) = delete;
  session_registry_c &operator=(session_registry_c &&) = delete;

  session_registry_c(state_factory_t factory, logger_t logger,
                     std::optional<std::uint64_t> seed = std::nullopt);
  session_registry_c(state_factory_t factory, logger_t logger,
                     std::shared_ptr<ids::id_allocator_c> allocator);
  ~session_registry_c();

  //! \brief Allocate an id, build a state and store the session
  //! \throws ids::allocation_exhausted_exception, or whatever the factory
  //!         throws; nothing is stored in that case
  session_handle_t create(std::int32_t port);

  template <typename F>
  auto with_session(id_t id, F &&body)
      -> call_result_c<std::invoke_result_t<F, engine::compilation_state_if &>> {
    using result_t =
        call_result_c<std::invoke_result_t<F, engine::compilation_state_if &>>;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return result_t::error(fmt::format("No REPL state with id {} found", id));
    }
    return result_t::good(std::forward<F>(body)(*it->second->state_));
  }

  bool remove(id_t id);

  bool contains(id_t id) const;
  std::size_t size() const;
  std::vector<id_t> ids() const;

private:
  friend class registry_link_c;

  void on_handle_death(std::size_t serial);

  logger_t logger_;
  state_factory_t factory_;
  std::shared_ptr<ids::id_allocator_c> allocator_;
  std::shared_ptr<registry_link_c> link_;
  std::size_t next_serial_;

  mutable std::shared_mutex mutex_;
  std::map<id_t, std::unique_ptr<session_c>> sessions_;
  std::map<std::size_t, id_t> serial_to_id_;
};

} // namespace repld::session
