/**
 * @file transfer_coordinator.cpp
 * @brief Implementation of the drop coordinator
 */

#include "kcenon/file_drop/sender/transfer_coordinator.h"

#include <utility>

#include <boost/asio/post.hpp>

#include "kcenon/file_drop/core/channel_label.h"
#include "kcenon/file_drop/core/logging.h"

namespace kcenon::file_drop {

auto transfer_coordinator::create(channel_provider& provider,
                                  boost::asio::any_io_executor executor,
                                  std::vector<std::shared_ptr<const file_source>> files,
                                  const drop_config& config)
    -> result<std::unique_ptr<transfer_coordinator>> {
    get_logger().initialize();

    if (auto valid = config.validate(); !valid) {
        FD_LOG_ERROR(log_category::coordinator, valid.error().message);
        return unexpected(valid.error());
    }

    for (const auto& file : files) {
        if (!file) {
            return unexpected(error{error_code::invalid_configuration, "null file in drop"});
        }
    }

    std::unique_ptr<transfer_coordinator> coordinator(
        new transfer_coordinator(provider, executor, files.size()));

    for (auto& file : files) {
        auto label = channel_label::generate().to_string();

        auto channel = provider.create_data_channel(label);
        if (!channel) {
            transfer_log_context ctx;
            ctx.label = label;
            ctx.filename = file->name();
            ctx.error_message = channel.error().message;
            FD_LOG_ERROR_CTX(log_category::coordinator, "cannot create data channel", ctx);
            return unexpected(error{error_code::channel_create_failed,
                                    "cannot create data channel for " + file->name() + ": " +
                                        channel.error().message});
        }

        auto sender = chunked_sender::create(
            executor, std::move(channel.value()), std::move(file), config.max_message_size);

        coordinator->fileinfo_.push_back(sender->file());
        coordinator->total_size_ += sender->file().size;
        coordinator->senders_.push_back(std::move(sender));
    }

    coordinator->subscribe();

    FD_LOG_INFO(log_category::coordinator,
                "drop created: " + std::to_string(coordinator->senders_.size()) + " files, " +
                    std::to_string(coordinator->total_size_) + " bytes");

    return coordinator;
}

transfer_coordinator::transfer_coordinator(channel_provider& provider,
                                           boost::asio::any_io_executor executor,
                                           std::size_t file_count)
    : provider_(provider),
      executor_(std::move(executor)),
      join_(file_count),
      lifetime_(std::make_shared<char>()) {
    senders_.reserve(file_count);
    fileinfo_.reserve(file_count);
}

transfer_coordinator::~transfer_coordinator() {
    provider_.on_registered(nullptr);
    provider_.on_connected(nullptr);
    provider_.on_disconnected(nullptr);
}

void transfer_coordinator::subscribe() {
    std::weak_ptr<char> guard = lifetime_;

    provider_.on_registered([this, guard](const std::string& drop_id) {
        if (guard.expired()) return;
        id_ = drop_id;

        transfer_log_context ctx;
        ctx.drop_id = drop_id;
        FD_LOG_INFO_CTX(log_category::coordinator, "drop registered", ctx);

        if (auto callback = id_changed_callback_) {
            callback(drop_id);
        }
    });

    provider_.on_connected([this, guard] {
        if (guard.expired()) return;
        FD_LOG_INFO(log_category::coordinator, "recipient connected");
        if (auto callback = connected_callback_) {
            callback();
        }
    });

    provider_.on_disconnected([this, guard] {
        if (guard.expired()) return;
        FD_LOG_WARN(log_category::coordinator, "recipient disconnected");
        if (auto callback = disconnected_callback_) {
            callback();
        }
    });

    for (std::size_t index = 0; index < senders_.size(); ++index) {
        auto& sender = senders_[index];

        sender->on_done([this, guard, index] {
            if (guard.expired()) return;
            join_.resolve(index);
        });

        sender->on_failed([this, guard, index](const error& err) {
            if (guard.expired()) return;
            const auto& failed = *senders_[index];
            join_.reject(index, drop_failure{index, failed.label(), failed.file().name, err});
        });
    }

    join_.on_settled([this, guard](const drop_outcome& outcome) {
        boost::asio::post(executor_, [this, guard, outcome] {
            if (guard.expired()) return;
            emit_outcome(outcome);
        });
    });

    join_.start();
}

void transfer_coordinator::emit_outcome(const drop_outcome& outcome) {
    transfer_log_context ctx;
    ctx.drop_id = id_;
    ctx.file_size = total_size_;
    ctx.offset = bytes_sent();

    if (outcome.status == drop_status::done) {
        FD_LOG_INFO_CTX(log_category::coordinator, "drop done", ctx);
        if (auto callback = done_callback_) {
            callback();
        }
        return;
    }

    if (outcome.failure) {
        ctx.label = outcome.failure->label;
        ctx.filename = outcome.failure->filename;
        ctx.error_message = outcome.failure->cause.message;
    }
    FD_LOG_ERROR_CTX(log_category::coordinator, "drop failed", ctx);

    if (auto callback = failed_callback_) {
        callback(outcome.failure.value_or(drop_failure{}));
    }
}

void transfer_coordinator::on_id_changed(id_callback callback) {
    id_changed_callback_ = std::move(callback);
}

void transfer_coordinator::on_connected(event_callback callback) {
    connected_callback_ = std::move(callback);
}

void transfer_coordinator::on_disconnected(event_callback callback) {
    disconnected_callback_ = std::move(callback);
}

void transfer_coordinator::on_done(event_callback callback) {
    done_callback_ = std::move(callback);
}

void transfer_coordinator::on_failed(failed_callback callback) {
    failed_callback_ = std::move(callback);
}

auto transfer_coordinator::bytes_sent() const -> uint64_t {
    uint64_t sent = 0;
    for (const auto& sender : senders_) {
        sent += sender->offset();
    }
    return sent;
}

auto transfer_coordinator::progress() const -> drop_progress {
    drop_progress progress;
    progress.total_files = senders_.size();
    progress.total_bytes = total_size_;

    for (const auto& sender : senders_) {
        progress.bytes_sent += sender->offset();
        if (sender->state() == sender_state::done) {
            ++progress.completed_files;
        } else if (sender->state() == sender_state::failed) {
            ++progress.failed_files;
        }
    }

    return progress;
}

}  // namespace kcenon::file_drop
