#pragma once

#include "trustgate/common/result.hpp"
#include "trustgate/security/permission_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trustgate::security {

enum class QueueState { Idle, Showing };
enum class ChoiceKind { AllowOnce, AllowAlways, Deny, DenyWithAlternative };

struct ConfirmationChoice {
  ChoiceKind kind = ChoiceKind::Deny;
  /// Deny reason, or the alternative instructions handed back to the model.
  std::string message;

  [[nodiscard]] static ConfirmationChoice allow_once();
  [[nodiscard]] static ConfirmationChoice allow_always();
  [[nodiscard]] static ConfirmationChoice deny(std::string message = "");
  [[nodiscard]] static ConfirmationChoice deny_with_alternative(std::string instructions);
};

struct ConfirmationCancelled {
  std::string reason;
};

using ConfirmationResult = std::variant<ConfirmationChoice, ConfirmationCancelled>;

struct ConfirmationRequest {
  std::string tool_name;
  ToolInput tool_input;
  std::optional<std::string> suggested_pattern;
  std::vector<PermissionRule> suggested_rules;
  /// Set when "always allow" must not be offered (dangerous or out-of-bounds commands).
  bool hide_persistent_option = false;
};

/// What a consumer renders: the showing item and how many wait behind it.
struct ConfirmationView {
  std::uint64_t id = 0;
  ConfirmationRequest request;
  std::size_t backlog = 0;
};

[[nodiscard]] std::string queue_state_to_string(QueueState state);
[[nodiscard]] std::string choice_kind_to_string(ChoiceKind kind);

/// FIFO of confirmation requests. Exactly one item is showing while the queue is
/// non-empty; decide() and cancel() act on that item only and then advance.
/// Consumers that render a view should answer with the id-taking overloads, which
/// fail instead of resolving a different item that replaced the one rendered.
class ConfirmationQueue {
public:
  using Listener = std::function<void(const std::optional<ConfirmationView> &)>;

  ConfirmationQueue() = default;
  ~ConfirmationQueue();

  ConfirmationQueue(const ConfirmationQueue &) = delete;
  ConfirmationQueue &operator=(const ConfirmationQueue &) = delete;

  [[nodiscard]] std::future<ConfirmationResult> enqueue(ConfirmationRequest request);

  [[nodiscard]] common::Status decide(ConfirmationChoice choice);
  [[nodiscard]] common::Status decide(std::uint64_t id, ConfirmationChoice choice);
  [[nodiscard]] common::Status cancel(std::string reason = "cancelled by user");
  [[nodiscard]] common::Status cancel(std::uint64_t id, std::string reason);

  [[nodiscard]] std::optional<ConfirmationView> current() const;
  [[nodiscard]] QueueState state() const;
  /// Free-text input is disabled while a confirmation is showing.
  [[nodiscard]] bool input_enabled() const;
  [[nodiscard]] std::size_t pending_count() const;
  [[nodiscard]] std::optional<ConfirmationView>
  wait_for_current(std::chrono::milliseconds timeout) const;

  /// Called after every transition with the newly showing item (nullopt when idle).
  /// Invoked without the queue lock held, so it may call decide(). Deliveries are
  /// serialized in transition order; a view superseded by a later transition is
  /// dropped rather than delivered late.
  void set_listener(Listener listener);
  void clear_listener();

private:
  struct Item {
    std::uint64_t id = 0;
    ConfirmationRequest request;
    std::promise<ConfirmationResult> promise;
    std::chrono::steady_clock::time_point enqueued_at;
  };

  [[nodiscard]] common::Status resolve_front(std::optional<std::uint64_t> expected_id,
                                             ConfirmationResult result, const std::string &action);
  [[nodiscard]] std::optional<ConfirmationView> view_locked() const;
  void notify(const std::optional<ConfirmationView> &view, std::uint64_t transition);

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<Item> items_;
  std::uint64_t next_id_ = 1;
  std::uint64_t transition_ = 0;
  Listener listener_;

  // Recursive so a listener can decide() and have the next view delivered inline.
  std::recursive_mutex notify_mutex_;
  std::uint64_t delivered_transition_ = 0;
};

} // namespace trustgate::security
