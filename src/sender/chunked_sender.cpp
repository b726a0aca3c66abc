/**
 * @file chunked_sender.cpp
 * @brief Implementation of the per-file transfer state machine
 */

#include "kcenon/file_drop/sender/chunked_sender.h"

#include <algorithm>
#include <utility>

#include <boost/asio/post.hpp>

#include "kcenon/file_drop/core/control_message.h"

namespace kcenon::file_drop {

auto chunked_sender::create(boost::asio::any_io_executor executor,
                            std::unique_ptr<data_channel> channel,
                            std::shared_ptr<const file_source> file,
                            std::size_t max_message_size) -> std::shared_ptr<chunked_sender> {
    std::shared_ptr<chunked_sender> sender(new chunked_sender(
        std::move(executor), std::move(channel), std::move(file), max_message_size));
    sender->subscribe();
    return sender;
}

chunked_sender::chunked_sender(boost::asio::any_io_executor executor,
                               std::unique_ptr<data_channel> channel,
                               std::shared_ptr<const file_source> file,
                               std::size_t max_message_size)
    : executor_(std::move(executor)),
      channel_(std::move(channel)),
      file_(std::move(file)),
      descriptor_(file_descriptor::from(*file_)),
      max_message_size_(max_message_size) {}

chunked_sender::~chunked_sender() {
    if (channel_) {
        channel_->on_open(nullptr);
        channel_->on_buffered_amount_low(nullptr);
    }
}

void chunked_sender::subscribe() {
    std::weak_ptr<chunked_sender> weak = weak_from_this();

    channel_->on_open([weak] {
        if (auto self = weak.lock()) {
            self->dispatch(sender_event::opened);
        }
    });
    channel_->on_buffered_amount_low([weak] {
        if (auto self = weak.lock()) {
            self->dispatch(sender_event::buffered_amount_low);
        }
    });
}

void chunked_sender::on_done(done_callback callback) {
    done_callback_ = std::move(callback);
}

void chunked_sender::on_failed(failed_callback callback) {
    failed_callback_ = std::move(callback);
}

auto chunked_sender::label() const -> const std::string& {
    return channel_->label();
}

void chunked_sender::dispatch(sender_event event) {
    switch (state_) {
        case sender_state::awaiting_open:
            announce_fileinfo();
            break;

        case sender_state::sending:
            if (offset_ >= descriptor_.size) {
                send_done();
            } else {
                produce_next_chunk();
            }
            break;

        case sender_state::announcing_info:
        case sender_state::awaiting_next_chunk:
        case sender_state::done:
        case sender_state::failed:
            if (get_logger().is_enabled(log_level::trace)) {
                auto ctx = log_context();
                FD_LOG_TRACE_CTX(log_category::sender,
                                 std::string("ignoring ") + to_string(event) + " in state " +
                                     to_string(state_),
                                 ctx);
            }
            break;
    }
}

void chunked_sender::announce_fileinfo() {
    state_ = sender_state::announcing_info;

    if (auto sent = channel_->send_text(encode_fileinfo(descriptor_)); !sent) {
        fail(sent.error());
        return;
    }

    state_ = sender_state::sending;

    auto ctx = log_context();
    FD_LOG_DEBUG_CTX(log_category::sender, "fileinfo sent", ctx);
}

void chunked_sender::send_done() {
    if (auto sent = channel_->send_text(encode_done()); !sent) {
        fail(sent.error());
        return;
    }

    state_ = sender_state::done;

    auto ctx = log_context();
    FD_LOG_INFO_CTX(log_category::sender, "file sent", ctx);

    if (done_callback_) {
        auto callback = std::move(done_callback_);
        done_callback_ = nullptr;
        callback();
    }
}

void chunked_sender::produce_next_chunk() {
    state_ = sender_state::awaiting_next_chunk;

    const uint64_t begin = offset_;
    const uint64_t end = std::min<uint64_t>(begin + max_message_size_, descriptor_.size);

    boost::asio::post(executor_, [weak = weak_from_this(), begin, end] {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        auto data = self->file_->read(begin, static_cast<std::size_t>(end - begin));
        self->complete_chunk(end, std::move(data));
    });
}

void chunked_sender::complete_chunk(uint64_t end, result<std::vector<std::byte>> data) {
    if (!data) {
        fail(data.error());
        return;
    }

    if (auto sent = channel_->send_binary(data.value()); !sent) {
        fail(sent.error());
        return;
    }

    offset_ = end;
    ++payload_messages_;
    state_ = sender_state::sending;

    if (get_logger().is_enabled(log_level::trace)) {
        auto ctx = log_context();
        ctx.chunk_size = data.value().size();
        FD_LOG_TRACE_CTX(log_category::sender, "chunk sent", ctx);
    }
}

void chunked_sender::fail(const error& err) {
    state_ = sender_state::failed;
    last_error_ = err;

    auto ctx = log_context();
    ctx.error_message = err.message;
    FD_LOG_ERROR_CTX(log_category::sender, "transfer stalled", ctx);

    if (failed_callback_) {
        auto callback = std::move(failed_callback_);
        failed_callback_ = nullptr;
        callback(err);
    }
}

auto chunked_sender::log_context() const -> transfer_log_context {
    transfer_log_context ctx;
    ctx.label = channel_->label();
    ctx.filename = descriptor_.name;
    ctx.file_size = descriptor_.size;
    ctx.offset = offset_;
    return ctx;
}

}  // namespace kcenon::file_drop
