/**
 * @file data_channel.h
 * @brief Channel and channel-provider interfaces consumed by the sender
 *
 * These are the boundary to the peer connection layer. Implementations must
 * deliver every callback on the executor the drop runs on, and never invoke
 * a callback from inside send_text() or send_binary().
 */

#ifndef KCENON_FILE_DROP_TRANSPORT_DATA_CHANNEL_H
#define KCENON_FILE_DROP_TRANSPORT_DATA_CHANNEL_H

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "kcenon/file_drop/core/types.h"

namespace kcenon::file_drop {

/**
 * @brief Ordered, message-oriented, bidirectional channel to the peer
 *
 * Each message handed to send_text() or send_binary() arrives as one message,
 * in the order the sends were made.
 */
class data_channel {
public:
    using event_callback = std::function<void()>;

    virtual ~data_channel() = default;

    data_channel(const data_channel&) = delete;
    auto operator=(const data_channel&) -> data_channel& = delete;

    [[nodiscard]] virtual auto label() const -> const std::string& = 0;

    /**
     * @brief Set the callback fired once when the channel becomes writable
     */
    virtual void on_open(event_callback callback) = 0;

    /**
     * @brief Set the callback fired whenever buffered_amount() drops to the
     *        low-water mark
     *
     * May fire any number of times.
     */
    virtual void on_buffered_amount_low(event_callback callback) = 0;

    /**
     * @brief Queue a text message
     */
    [[nodiscard]] virtual auto send_text(std::string_view text) -> result<void> = 0;

    /**
     * @brief Queue a binary message
     */
    [[nodiscard]] virtual auto send_binary(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Bytes queued but not yet handed to the network
     */
    [[nodiscard]] virtual auto buffered_amount() const -> std::size_t = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    virtual void close() = 0;

protected:
    data_channel() = default;
};

/**
 * @brief The peer connection as seen by a drop
 *
 * Creates channels and reports the signaling lifecycle. Each event has one
 * callback slot; setting a callback replaces the previous one and nullptr
 * clears it.
 */
class channel_provider {
public:
    using registered_callback = std::function<void(const std::string& drop_id)>;
    using event_callback = std::function<void()>;

    virtual ~channel_provider() = default;

    channel_provider(const channel_provider&) = delete;
    auto operator=(const channel_provider&) -> channel_provider& = delete;

    /**
     * @brief Create a new channel
     * @param label Process-unique label of the channel
     * @return A distinct channel, or channel_create_failed
     */
    [[nodiscard]] virtual auto create_data_channel(const std::string& label)
        -> result<std::unique_ptr<data_channel>> = 0;

    /**
     * @brief Drop registered with signaling; the argument is the drop id
     */
    virtual void on_registered(registered_callback callback) = 0;

    /**
     * @brief Recipient connected
     */
    virtual void on_connected(event_callback callback) = 0;

    /**
     * @brief Recipient disconnected, intentionally or not
     */
    virtual void on_disconnected(event_callback callback) = 0;

protected:
    channel_provider() = default;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_TRANSPORT_DATA_CHANNEL_H
