/**
 * @file transfer_coordinator.h
 * @brief Drops a batch of files, one channel per file
 */

#ifndef KCENON_FILE_DROP_SENDER_TRANSFER_COORDINATOR_H
#define KCENON_FILE_DROP_SENDER_TRANSFER_COORDINATOR_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include "kcenon/file_drop/core/drop_config.h"
#include "kcenon/file_drop/core/file_descriptor.h"
#include "kcenon/file_drop/core/file_source.h"
#include "kcenon/file_drop/core/types.h"
#include "kcenon/file_drop/sender/chunked_sender.h"
#include "kcenon/file_drop/sender/completion_join.h"
#include "kcenon/file_drop/sender/sender_types.h"
#include "kcenon/file_drop/transport/data_channel.h"

namespace kcenon::file_drop {

/**
 * @brief One drop: a fixed set of files sent to one recipient
 *
 * Creates one chunked_sender per file, each on its own channel obtained
 * from the provider, and reports a single outcome for the whole drop:
 * done once every file was sent, or failed as soon as any file stalls.
 * The provider's registered, connected and disconnected events are relayed
 * to the coordinator's observers unchanged.
 *
 * Outcome callbacks are posted to the executor, so observers registered
 * right after create() never miss them and may destroy the coordinator from
 * inside a callback.
 *
 * @code
 * auto drop = transfer_coordinator::create(peer, io.get_executor(), files);
 * if (drop.has_value()) {
 *     auto& coordinator = *drop.value();
 *     coordinator.on_done([] { std::cout << "dropped\n"; });
 *     coordinator.on_failed([](const drop_failure& f) { std::cerr << f.filename << "\n"; });
 *     io.run();
 * }
 * @endcode
 *
 * @note Not thread-safe. Use it from the executor's thread only; the provider
 *       must outlive the coordinator.
 */
class transfer_coordinator {
public:
    using id_callback = std::function<void(const std::string& drop_id)>;
    using event_callback = std::function<void()>;
    using failed_callback = std::function<void(const drop_failure&)>;

    /**
     * @brief Start a drop
     * @param provider Peer connection creating the channels
     * @param executor Executor the provider and channels deliver events on
     * @param files Files to drop, in order
     * @param config Drop configuration
     * @return The coordinator, or invalid_message_size / invalid_configuration /
     *         channel_create_failed
     */
    [[nodiscard]] static auto create(channel_provider& provider,
                                     boost::asio::any_io_executor executor,
                                     std::vector<std::shared_ptr<const file_source>> files,
                                     const drop_config& config = {})
        -> result<std::unique_ptr<transfer_coordinator>>;

    ~transfer_coordinator();

    transfer_coordinator(const transfer_coordinator&) = delete;
    auto operator=(const transfer_coordinator&) -> transfer_coordinator& = delete;

    // Observers. Each setter replaces the previous callback.
    void on_id_changed(id_callback callback);
    void on_connected(event_callback callback);
    void on_disconnected(event_callback callback);
    void on_done(event_callback callback);
    void on_failed(failed_callback callback);

    /**
     * @brief Drop identifier assigned by signaling, once registered
     */
    [[nodiscard]] auto id() const -> const std::optional<std::string>& { return id_; }

    /**
     * @brief Descriptions of the dropped files, in input order
     */
    [[nodiscard]] auto files() const -> const std::vector<file_descriptor>& { return fileinfo_; }

    [[nodiscard]] auto total_size() const noexcept -> uint64_t { return total_size_; }

    /**
     * @brief Sum of every sender's offset, computed on each call
     */
    [[nodiscard]] auto bytes_sent() const -> uint64_t;

    [[nodiscard]] auto progress() const -> drop_progress;

    [[nodiscard]] auto sender_count() const noexcept -> std::size_t { return senders_.size(); }

    /**
     * @brief Current state of the sender for file @p index
     */
    [[nodiscard]] auto state_of(std::size_t index) const -> sender_state {
        return senders_.at(index)->state();
    }

    [[nodiscard]] auto sender(std::size_t index) const -> const chunked_sender& {
        return *senders_.at(index);
    }

    /**
     * @brief Outcome of the drop once it has settled
     */
    [[nodiscard]] auto outcome() const -> const std::optional<drop_outcome>& {
        return join_.outcome();
    }

private:
    transfer_coordinator(channel_provider& provider,
                         boost::asio::any_io_executor executor,
                         std::size_t file_count);

    void subscribe();
    void emit_outcome(const drop_outcome& outcome);

    channel_provider& provider_;
    boost::asio::any_io_executor executor_;
    std::vector<std::shared_ptr<chunked_sender>> senders_;
    std::vector<file_descriptor> fileinfo_;
    uint64_t total_size_ = 0;
    std::optional<std::string> id_;
    completion_join join_;

    id_callback id_changed_callback_;
    event_callback connected_callback_;
    event_callback disconnected_callback_;
    event_callback done_callback_;
    failed_callback failed_callback_;

    // Expires with the coordinator; posted tasks check it before touching this
    std::shared_ptr<char> lifetime_;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_SENDER_TRANSFER_COORDINATOR_H
