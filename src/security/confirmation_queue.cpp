#include "trustgate/security/confirmation_queue.hpp"

#include "trustgate/observability/global.hpp"

namespace trustgate::security {

ConfirmationChoice ConfirmationChoice::allow_once() {
  return ConfirmationChoice{.kind = ChoiceKind::AllowOnce, .message = ""};
}

ConfirmationChoice ConfirmationChoice::allow_always() {
  return ConfirmationChoice{.kind = ChoiceKind::AllowAlways, .message = ""};
}

ConfirmationChoice ConfirmationChoice::deny(std::string message) {
  return ConfirmationChoice{.kind = ChoiceKind::Deny, .message = std::move(message)};
}

ConfirmationChoice ConfirmationChoice::deny_with_alternative(std::string instructions) {
  return ConfirmationChoice{.kind = ChoiceKind::DenyWithAlternative,
                            .message = std::move(instructions)};
}

std::string queue_state_to_string(const QueueState state) {
  return state == QueueState::Idle ? "idle" : "showing";
}

std::string choice_kind_to_string(const ChoiceKind kind) {
  switch (kind) {
  case ChoiceKind::AllowOnce:
    return "allow-once";
  case ChoiceKind::AllowAlways:
    return "allow-always";
  case ChoiceKind::Deny:
    return "deny";
  case ChoiceKind::DenyWithAlternative:
    return "deny-with-alternative";
  }
  return "deny";
}

ConfirmationQueue::~ConfirmationQueue() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &item : items_) {
    item.promise.set_value(ConfirmationCancelled{.reason = "confirmation queue shut down"});
  }
  items_.clear();
}

std::future<ConfirmationResult> ConfirmationQueue::enqueue(ConfirmationRequest request) {
  std::future<ConfirmationResult> future;
  std::optional<ConfirmationView> view;
  bool became_showing = false;
  bool has_listener = false;
  std::uint64_t id = 0;
  std::uint64_t transition = 0;
  std::size_t depth = 0;
  const std::string tool = request.tool_name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Item item;
    item.id = next_id_++;
    item.request = std::move(request);
    item.enqueued_at = std::chrono::steady_clock::now();
    future = item.promise.get_future();
    id = item.id;
    items_.push_back(std::move(item));
    became_showing = items_.size() == 1;
    if (became_showing) {
      transition = ++transition_;
    }
    has_listener = static_cast<bool>(listener_);
    depth = items_.size();
    view = view_locked();
  }
  cv_.notify_all();

  observability::record_confirmation(tool, "enqueued", id);
  observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  if (!has_listener) {
    observability::record_warning("confirmation_queue",
                                  "no confirmation consumer attached; item " +
                                      std::to_string(id) + " stays pending");
  }
  if (became_showing) {
    notify(view, transition);
  }
  return future;
}

namespace {

std::string action_for(const ChoiceKind kind) {
  switch (kind) {
  case ChoiceKind::AllowOnce:
  case ChoiceKind::AllowAlways:
    return "allowed";
  case ChoiceKind::Deny:
  case ChoiceKind::DenyWithAlternative:
    return "denied";
  }
  return "denied";
}

} // namespace

common::Status ConfirmationQueue::decide(ConfirmationChoice choice) {
  const std::string action = action_for(choice.kind);
  return resolve_front(std::nullopt, std::move(choice), action);
}

common::Status ConfirmationQueue::decide(const std::uint64_t id, ConfirmationChoice choice) {
  const std::string action = action_for(choice.kind);
  return resolve_front(id, std::move(choice), action);
}

common::Status ConfirmationQueue::cancel(std::string reason) {
  return resolve_front(std::nullopt, ConfirmationCancelled{.reason = std::move(reason)},
                       "cancelled");
}

common::Status ConfirmationQueue::cancel(const std::uint64_t id, std::string reason) {
  return resolve_front(id, ConfirmationCancelled{.reason = std::move(reason)}, "cancelled");
}

common::Status ConfirmationQueue::resolve_front(const std::optional<std::uint64_t> expected_id,
                                                ConfirmationResult result,
                                                const std::string &action) {
  Item item;
  std::optional<ConfirmationView> next;
  std::uint64_t transition = 0;
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return common::Status::error("no confirmation is showing");
    }
    if (expected_id.has_value() && items_.front().id != *expected_id) {
      return common::Status::error("confirmation " + std::to_string(*expected_id) +
                                   " is not showing");
    }
    item = std::move(items_.front());
    items_.pop_front();
    depth = items_.size();
    next = view_locked();
    transition = ++transition_;
  }
  cv_.notify_all();

  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - item.enqueued_at);
  item.promise.set_value(std::move(result));

  observability::record_confirmation(item.request.tool_name, action, item.id);
  observability::record_metric(observability::ConfirmationLatencyMetric{.latency = latency});
  observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  notify(next, transition);
  return common::Status::success();
}

std::optional<ConfirmationView> ConfirmationQueue::view_locked() const {
  if (items_.empty()) {
    return std::nullopt;
  }
  return ConfirmationView{
      .id = items_.front().id, .request = items_.front().request, .backlog = items_.size() - 1};
}

std::optional<ConfirmationView> ConfirmationQueue::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return view_locked();
}

QueueState ConfirmationQueue::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.empty() ? QueueState::Idle : QueueState::Showing;
}

bool ConfirmationQueue::input_enabled() const { return state() == QueueState::Idle; }

std::size_t ConfirmationQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

std::optional<ConfirmationView>
ConfirmationQueue::wait_for_current(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return !items_.empty(); });
  return view_locked();
}

void ConfirmationQueue::set_listener(Listener listener) {
  std::optional<ConfirmationView> view;
  std::uint64_t transition = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
    view = view_locked();
    if (view.has_value()) {
      transition = ++transition_;
    }
  }
  // A consumer attaching late still sees the item that is already waiting.
  if (view.has_value()) {
    notify(view, transition);
  }
}

void ConfirmationQueue::clear_listener() {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = nullptr;
}

void ConfirmationQueue::notify(const std::optional<ConfirmationView> &view,
                               const std::uint64_t transition) {
  std::lock_guard<std::recursive_mutex> delivery(notify_mutex_);
  if (transition <= delivered_transition_) {
    return;
  }
  delivered_transition_ = transition;
  Listener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(view);
  }
}

} // namespace trustgate::security
