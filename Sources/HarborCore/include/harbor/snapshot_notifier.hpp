#pragma once

#include <functional>
#include <memory>
#include <string>

namespace harbor {

/// Tells other processes sharing the same store file that a reference-data
/// snapshot was committed. Each post carries the id of the posting instance
/// so a listener can skip its own commits.
class snapshot_notifier {
public:
    using callback = std::function<void(const std::string& origin_instance)>;

    virtual ~snapshot_notifier() = default;

    virtual void post(const std::string& origin_instance) = 0;

    /// The callback runs on the notifier's own thread.
    virtual void subscribe(callback fn) = 0;

    virtual void unsubscribe() = 0;

    [[nodiscard]] virtual bool is_subscribed() const noexcept = 0;
};

/// Platform notifier for the store at db_path, or nullptr for in-memory
/// stores and platforms without one.
std::unique_ptr<snapshot_notifier> make_snapshot_notifier(const std::string& db_path);

} // namespace harbor
