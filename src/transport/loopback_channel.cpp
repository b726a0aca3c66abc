/**
 * @file loopback_channel.cpp
 * @brief Implementation of the loopback channel provider
 */

#include "kcenon/file_drop/transport/loopback_channel.h"

#include <algorithm>
#include <utility>

#include <boost/asio/post.hpp>

#include "kcenon/file_drop/core/logging.h"

namespace kcenon::file_drop {

namespace detail {

// State shared by a provider and its channels, so either side may go first
struct loopback_hub {
    boost::asio::any_io_executor executor;
    std::size_t low_water_mark = 0;
    loopback_sink sink;
    std::vector<loopback_channel*> channels;
    bool connected = false;
};

}  // namespace detail

// loopback_channel

loopback_channel::loopback_channel(std::shared_ptr<detail::loopback_hub> hub, std::string label)
    : hub_(std::move(hub)), label_(std::move(label)), lifetime_(std::make_shared<char>()) {
    hub_->channels.push_back(this);
}

loopback_channel::~loopback_channel() {
    auto& channels = hub_->channels;
    channels.erase(std::remove(channels.begin(), channels.end(), this), channels.end());
}

void loopback_channel::on_open(event_callback callback) {
    open_callback_ = std::move(callback);
}

void loopback_channel::on_buffered_amount_low(event_callback callback) {
    buffered_low_callback_ = std::move(callback);
}

auto loopback_channel::send_text(std::string_view text) -> result<void> {
    loopback_message message;
    message.label = label_;
    message.text.assign(text.begin(), text.end());
    return enqueue(std::move(message));
}

auto loopback_channel::send_binary(std::span<const std::byte> data) -> result<void> {
    loopback_message message;
    message.label = label_;
    message.binary = true;
    message.data.assign(data.begin(), data.end());
    return enqueue(std::move(message));
}

auto loopback_channel::enqueue(loopback_message message) -> result<void> {
    if (state_ == channel_state::closed) {
        return unexpected(error{error_code::channel_closed, "channel closed: " + label_});
    }
    if (state_ != channel_state::open) {
        return unexpected(error{error_code::channel_not_open, "channel not open: " + label_});
    }

    buffered_ += message.size();

    std::weak_ptr<char> guard = lifetime_;
    boost::asio::post(hub_->executor, [this, guard, message = std::move(message)] {
        if (guard.expired()) return;
        deliver(message);
    });

    return result<void>{};
}

void loopback_channel::deliver(const loopback_message& message) {
    if (state_ == channel_state::closed) {
        return;
    }

    const bool was_above = buffered_ > hub_->low_water_mark;
    buffered_ -= std::min(buffered_, message.size());

    std::weak_ptr<char> guard = lifetime_;
    if (auto sink = hub_->sink) {
        sink(message);
    }
    if (guard.expired()) return;

    if (was_above && buffered_ <= hub_->low_water_mark && state_ == channel_state::open) {
        if (auto callback = buffered_low_callback_) {
            callback();
        }
    }
}

void loopback_channel::open() {
    if (state_ != channel_state::connecting) {
        return;
    }
    state_ = channel_state::open;

    FD_LOG_DEBUG(log_category::channel, "channel open: " + label_);

    std::weak_ptr<char> guard = lifetime_;
    boost::asio::post(hub_->executor, [this, guard] {
        if (guard.expired() || state_ != channel_state::open) return;
        if (auto callback = open_callback_) {
            callback();
        }
    });
}

void loopback_channel::close() {
    if (state_ == channel_state::closed) {
        return;
    }
    state_ = channel_state::closed;
    buffered_ = 0;

    FD_LOG_DEBUG(log_category::channel, "channel closed: " + label_);
}

// loopback_provider

loopback_provider::loopback_provider(boost::asio::any_io_executor executor,
                                     std::size_t low_water_mark)
    : hub_(std::make_shared<detail::loopback_hub>()), lifetime_(std::make_shared<char>()) {
    hub_->executor = std::move(executor);
    hub_->low_water_mark = low_water_mark;
}

loopback_provider::~loopback_provider() = default;

auto loopback_provider::create_data_channel(const std::string& label)
    -> result<std::unique_ptr<data_channel>> {
    if (label.empty()) {
        return unexpected(error{error_code::channel_create_failed, "empty channel label"});
    }

    const auto& channels = hub_->channels;
    const bool taken = std::any_of(channels.begin(), channels.end(),
                                   [&label](const loopback_channel* c) { return c->label() == label; });
    if (taken) {
        return unexpected(error{error_code::channel_create_failed, "duplicate channel label: " + label});
    }

    auto channel = std::make_unique<loopback_channel>(hub_, label);
    if (hub_->connected) {
        channel->open();
    }
    return std::unique_ptr<data_channel>(std::move(channel));
}

void loopback_provider::on_registered(registered_callback callback) {
    registered_callback_ = std::move(callback);
}

void loopback_provider::on_connected(event_callback callback) {
    connected_callback_ = std::move(callback);
}

void loopback_provider::on_disconnected(event_callback callback) {
    disconnected_callback_ = std::move(callback);
}

void loopback_provider::set_sink(loopback_sink sink) {
    hub_->sink = std::move(sink);
}

void loopback_provider::register_drop(const std::string& drop_id) {
    std::weak_ptr<char> guard = lifetime_;
    boost::asio::post(hub_->executor, [this, guard, drop_id] {
        if (guard.expired()) return;
        if (auto callback = registered_callback_) {
            callback(drop_id);
        }
    });
}

void loopback_provider::connect() {
    std::weak_ptr<char> guard = lifetime_;
    boost::asio::post(hub_->executor, [this, guard] {
        if (guard.expired() || hub_->connected) return;
        hub_->connected = true;

        FD_LOG_DEBUG(log_category::channel,
                     "peer connected, opening " + std::to_string(hub_->channels.size()) +
                         " channels");

        if (auto callback = connected_callback_) {
            callback();
        }
        if (guard.expired()) return;

        // open() only posts, so the list is stable while iterating
        for (auto* channel : hub_->channels) {
            channel->open();
        }
    });
}

void loopback_provider::disconnect() {
    std::weak_ptr<char> guard = lifetime_;
    boost::asio::post(hub_->executor, [this, guard] {
        if (guard.expired() || !hub_->connected) return;
        hub_->connected = false;

        for (auto* channel : hub_->channels) {
            channel->close();
        }

        FD_LOG_DEBUG(log_category::channel, "peer disconnected");

        if (auto callback = disconnected_callback_) {
            callback();
        }
    });
}

auto loopback_provider::is_connected() const noexcept -> bool {
    return hub_->connected;
}

auto loopback_provider::channel_count() const noexcept -> std::size_t {
    return hub_->channels.size();
}

auto loopback_provider::low_water_mark() const noexcept -> std::size_t {
    return hub_->low_water_mark;
}

}  // namespace kcenon::file_drop
