/**
 * @file loopback_channel.h
 * @brief In-process channel provider delivering messages to a local sink
 */

#ifndef KCENON_FILE_DROP_TRANSPORT_LOOPBACK_CHANNEL_H
#define KCENON_FILE_DROP_TRANSPORT_LOOPBACK_CHANNEL_H

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include "kcenon/file_drop/core/types.h"
#include "kcenon/file_drop/transport/data_channel.h"

namespace kcenon::file_drop {

/**
 * @brief One message as it arrives at the receiving side
 */
struct loopback_message {
    std::string label;
    bool binary = false;
    std::string text;
    std::vector<std::byte> data;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return binary ? data.size() : text.size();
    }
};

using loopback_sink = std::function<void(const loopback_message&)>;

namespace detail {
struct loopback_hub;
}  // namespace detail

/**
 * @brief Channel half of the loopback provider
 *
 * Every send is queued and delivered to the provider's sink by a separate
 * executor task. buffered_amount() counts queued bytes; buffered-amount-low
 * fires after a delivery brings it from above the low-water mark down to or
 * below it.
 */
class loopback_channel : public data_channel {
public:
    loopback_channel(std::shared_ptr<detail::loopback_hub> hub, std::string label);
    ~loopback_channel() override;

    [[nodiscard]] auto label() const -> const std::string& override { return label_; }

    void on_open(event_callback callback) override;
    void on_buffered_amount_low(event_callback callback) override;

    [[nodiscard]] auto send_text(std::string_view text) -> result<void> override;
    [[nodiscard]] auto send_binary(std::span<const std::byte> data) -> result<void> override;

    [[nodiscard]] auto buffered_amount() const -> std::size_t override { return buffered_; }
    [[nodiscard]] auto is_open() const -> bool override { return state_ == channel_state::open; }

    void close() override;

    /**
     * @brief Make the channel writable and post its open event
     *
     * Called by the provider; no effect unless the channel is still connecting.
     */
    void open();

    [[nodiscard]] auto is_closed() const noexcept -> bool {
        return state_ == channel_state::closed;
    }

private:
    enum class channel_state { connecting, open, closed };

    auto enqueue(loopback_message message) -> result<void>;
    void deliver(const loopback_message& message);

    std::shared_ptr<detail::loopback_hub> hub_;
    std::string label_;
    channel_state state_ = channel_state::connecting;
    std::size_t buffered_ = 0;

    event_callback open_callback_;
    event_callback buffered_low_callback_;

    std::shared_ptr<char> lifetime_;
};

/**
 * @brief channel_provider that keeps both ends in this process
 *
 * Stands in for a peer connection in the example program and the
 * integration tests. register_drop(), connect() and disconnect() drive the
 * signaling events by hand; all events are posted to the executor.
 *
 * @code
 * boost::asio::io_context io;
 * loopback_provider peer(io.get_executor());
 * peer.set_sink([](const loopback_message& msg) { ... });
 * auto drop = transfer_coordinator::create(peer, io.get_executor(), files);
 * peer.register_drop("drop-1");
 * peer.connect();
 * io.run();
 * @endcode
 */
class loopback_provider : public channel_provider {
public:
    /**
     * @param executor Executor every event and delivery is posted to
     * @param low_water_mark buffered_amount() at or below which
     *        buffered-amount-low fires
     */
    explicit loopback_provider(boost::asio::any_io_executor executor,
                               std::size_t low_water_mark = 0);
    ~loopback_provider() override;

    /**
     * @brief Create a channel; labels must be non-empty and unique among live channels
     */
    [[nodiscard]] auto create_data_channel(const std::string& label)
        -> result<std::unique_ptr<data_channel>> override;

    void on_registered(registered_callback callback) override;
    void on_connected(event_callback callback) override;
    void on_disconnected(event_callback callback) override;

    /**
     * @brief Receive every delivered message, from all channels
     */
    void set_sink(loopback_sink sink);

    /**
     * @brief Post the registered event with the given drop id
     */
    void register_drop(const std::string& drop_id);

    /**
     * @brief Post the connected event, then open every channel
     *
     * Channels created after connecting open right away.
     */
    void connect();

    /**
     * @brief Close every channel, then post the disconnected event
     */
    void disconnect();

    [[nodiscard]] auto is_connected() const noexcept -> bool;

    [[nodiscard]] auto channel_count() const noexcept -> std::size_t;

    [[nodiscard]] auto low_water_mark() const noexcept -> std::size_t;

private:
    std::shared_ptr<detail::loopback_hub> hub_;

    registered_callback registered_callback_;
    event_callback connected_callback_;
    event_callback disconnected_callback_;

    std::shared_ptr<char> lifetime_;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_TRANSPORT_LOOPBACK_CHANNEL_H
