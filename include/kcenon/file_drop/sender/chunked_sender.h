/**
 * @file chunked_sender.h
 * @brief Streams one file over one data channel
 */

#ifndef KCENON_FILE_DROP_SENDER_CHUNKED_SENDER_H
#define KCENON_FILE_DROP_SENDER_CHUNKED_SENDER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include "kcenon/file_drop/core/file_descriptor.h"
#include "kcenon/file_drop/core/file_source.h"
#include "kcenon/file_drop/core/logging.h"
#include "kcenon/file_drop/core/types.h"
#include "kcenon/file_drop/sender/sender_types.h"
#include "kcenon/file_drop/transport/data_channel.h"

namespace kcenon::file_drop {

/**
 * @brief Per-file transfer state machine
 *
 * Bound to one exclusively owned channel, the sender announces the file,
 * streams its bytes as binary messages of at most max_message_size bytes,
 * then sends the done message. It is driven only by the channel's open and
 * buffered-amount-low events; both go through dispatch().
 *
 * Reading a chunk is posted to the executor as its own task, so channel
 * events can arrive while a read is pending. The awaiting_next_chunk state
 * makes those events no-ops, which keeps at most one chunk in production and
 * the payload in file order.
 *
 * A failed read or write is logged and moves the sender to failed; it then
 * ignores every further event.
 *
 * @note Not thread-safe. All calls and channel callbacks must happen on the
 *       executor passed to create().
 */
class chunked_sender : public std::enable_shared_from_this<chunked_sender> {
public:
    using done_callback = std::function<void()>;
    using failed_callback = std::function<void(const error&)>;

    /**
     * @brief Create a sender and subscribe it to the channel's events
     * @param executor Executor the channel delivers its events on
     * @param channel Freshly created channel, owned by the sender from now on
     * @param file File to send
     * @param max_message_size Largest binary message, in bytes (> 0)
     */
    [[nodiscard]] static auto create(boost::asio::any_io_executor executor,
                                     std::unique_ptr<data_channel> channel,
                                     std::shared_ptr<const file_source> file,
                                     std::size_t max_message_size)
        -> std::shared_ptr<chunked_sender>;

    ~chunked_sender();

    chunked_sender(const chunked_sender&) = delete;
    auto operator=(const chunked_sender&) -> chunked_sender& = delete;

    /**
     * @brief Set the callback fired once after the done message was sent
     */
    void on_done(done_callback callback);

    /**
     * @brief Set the callback fired once when the sender stalls on an error
     */
    void on_failed(failed_callback callback);

    [[nodiscard]] auto label() const -> const std::string&;

    [[nodiscard]] auto file() const -> const file_descriptor& { return descriptor_; }

    [[nodiscard]] auto state() const noexcept -> sender_state { return state_; }

    /**
     * @brief Bytes of the file handed to the channel so far
     */
    [[nodiscard]] auto offset() const noexcept -> uint64_t { return offset_; }

    /**
     * @brief Binary payload messages written so far
     */
    [[nodiscard]] auto payload_messages() const noexcept -> uint64_t { return payload_messages_; }

    [[nodiscard]] auto max_message_size() const noexcept -> std::size_t { return max_message_size_; }

    /**
     * @brief The error that stalled the sender, if any
     */
    [[nodiscard]] auto last_error() const -> const std::optional<error>& { return last_error_; }

private:
    chunked_sender(boost::asio::any_io_executor executor,
                   std::unique_ptr<data_channel> channel,
                   std::shared_ptr<const file_source> file,
                   std::size_t max_message_size);

    void subscribe();
    void dispatch(sender_event event);

    void announce_fileinfo();
    void send_done();
    void produce_next_chunk();
    void complete_chunk(uint64_t end, result<std::vector<std::byte>> data);
    void fail(const error& err);

    [[nodiscard]] auto log_context() const -> transfer_log_context;

    boost::asio::any_io_executor executor_;
    std::unique_ptr<data_channel> channel_;
    std::shared_ptr<const file_source> file_;
    file_descriptor descriptor_;
    std::size_t max_message_size_;

    sender_state state_ = sender_state::awaiting_open;
    uint64_t offset_ = 0;
    uint64_t payload_messages_ = 0;
    std::optional<error> last_error_;

    done_callback done_callback_;
    failed_callback failed_callback_;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_SENDER_CHUNKED_SENDER_H
