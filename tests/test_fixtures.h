/**
 * @file test_fixtures.h
 * @brief Scripted channels, file sources and fixtures shared by the tests
 */

#ifndef KCENON_FILE_DROP_TEST_FIXTURES_H
#define KCENON_FILE_DROP_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/file_drop/file_drop.h>

#include <boost/asio/io_context.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace kcenon::file_drop::test {

/**
 * @brief A message captured by a fake channel
 */
struct sent_message {
    bool binary = false;
    std::string text;
    std::vector<std::byte> data;
};

/**
 * @brief Test-side handle on a fake channel
 *
 * Outlives the channel itself, so tests can still inspect what was sent
 * after the sender that owned the channel is gone.
 */
struct fake_channel_state {
    std::string label;
    std::vector<sent_message> sent;
    data_channel::event_callback open_callback;
    data_channel::event_callback buffered_low_callback;
    bool fail_text = false;
    bool fail_binary = false;
    bool closed = false;
    bool destroyed = false;

    void fire_open() {
        if (auto callback = open_callback) callback();
    }

    void fire_buffered_low() {
        if (auto callback = buffered_low_callback) callback();
    }

    [[nodiscard]] auto texts() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& msg : sent) {
            if (!msg.binary) out.push_back(msg.text);
        }
        return out;
    }

    [[nodiscard]] auto payload_sizes() const -> std::vector<std::size_t> {
        std::vector<std::size_t> out;
        for (const auto& msg : sent) {
            if (msg.binary) out.push_back(msg.data.size());
        }
        return out;
    }

    [[nodiscard]] auto payload() const -> std::vector<std::byte> {
        std::vector<std::byte> out;
        for (const auto& msg : sent) {
            if (msg.binary) out.insert(out.end(), msg.data.begin(), msg.data.end());
        }
        return out;
    }

    [[nodiscard]] auto done_count() const -> std::size_t {
        std::size_t count = 0;
        for (const auto& text : texts()) {
            if (text == encode_done()) ++count;
        }
        return count;
    }
};

/**
 * @brief data_channel whose events are fired by hand
 */
class fake_channel : public data_channel {
public:
    explicit fake_channel(std::shared_ptr<fake_channel_state> state) : state_(std::move(state)) {}
    ~fake_channel() override { state_->destroyed = true; }

    auto label() const -> const std::string& override { return state_->label; }

    void on_open(event_callback callback) override { state_->open_callback = std::move(callback); }

    void on_buffered_amount_low(event_callback callback) override {
        state_->buffered_low_callback = std::move(callback);
    }

    auto send_text(std::string_view text) -> result<void> override {
        if (state_->fail_text) {
            return unexpected(error{error_code::channel_send_failed, "text send refused"});
        }
        state_->sent.push_back(sent_message{false, std::string(text), {}});
        return {};
    }

    auto send_binary(std::span<const std::byte> data) -> result<void> override {
        if (state_->fail_binary) {
            return unexpected(error{error_code::channel_send_failed, "binary send refused"});
        }
        state_->sent.push_back(sent_message{true, {}, {data.begin(), data.end()}});
        return {};
    }

    auto buffered_amount() const -> std::size_t override { return 0; }
    auto is_open() const -> bool override { return !state_->closed; }
    void close() override { state_->closed = true; }

private:
    std::shared_ptr<fake_channel_state> state_;
};

/**
 * @brief channel_provider that records every channel and fires events by hand
 */
class fake_provider : public channel_provider {
public:
    auto create_data_channel(const std::string& label)
        -> result<std::unique_ptr<data_channel>> override {
        if (fail_create_at && *fail_create_at == channels.size()) {
            return unexpected(error{error_code::channel_create_failed, "peer connection closed"});
        }
        auto state = std::make_shared<fake_channel_state>();
        state->label = label;
        channels.push_back(state);
        return std::unique_ptr<data_channel>(std::make_unique<fake_channel>(state));
    }

    void on_registered(registered_callback callback) override {
        registered_callback_ = std::move(callback);
    }
    void on_connected(event_callback callback) override {
        connected_callback_ = std::move(callback);
    }
    void on_disconnected(event_callback callback) override {
        disconnected_callback_ = std::move(callback);
    }

    void fire_registered(const std::string& drop_id) {
        if (auto callback = registered_callback_) callback(drop_id);
    }
    void fire_connected() {
        if (auto callback = connected_callback_) callback();
    }
    void fire_disconnected() {
        if (auto callback = disconnected_callback_) callback();
    }

    [[nodiscard]] auto has_subscribers() const -> bool {
        return registered_callback_ || connected_callback_ || disconnected_callback_;
    }

    std::vector<std::shared_ptr<fake_channel_state>> channels;
    std::optional<std::size_t> fail_create_at;

private:
    registered_callback registered_callback_;
    event_callback connected_callback_;
    event_callback disconnected_callback_;
};

/**
 * @brief In-memory file whose reads fail from a given offset on
 */
class failing_file_source : public file_source {
public:
    failing_file_source(std::string name, uint64_t size, uint64_t fail_from = 0)
        : name_(std::move(name)), size_(size), fail_from_(fail_from) {}

    auto name() const -> const std::string& override { return name_; }
    auto size() const -> uint64_t override { return size_; }
    auto media_type() const -> const std::string& override { return media_type_; }

    auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> override {
        if (offset + length > fail_from_) {
            return unexpected(error{error_code::file_read_error, "read failed: " + name_});
        }
        return std::vector<std::byte>(length, std::byte{0x5a});
    }

private:
    std::string name_;
    uint64_t size_;
    uint64_t fail_from_;
    std::string media_type_;
};

/**
 * @brief Deterministic pseudo-random bytes
 */
inline auto make_bytes(std::size_t size, unsigned seed = 42) -> std::vector<std::byte> {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

inline auto make_memory_file(const std::string& name, std::size_t size,
                             std::string media_type = "application/octet-stream")
    -> std::shared_ptr<const file_source> {
    return std::make_shared<memory_file_source>(name, make_bytes(size), std::move(media_type));
}

/**
 * @brief Fixture owning the executor the code under test runs on
 */
class ExecutorFixture : public ::testing::Test {
protected:
    /**
     * @brief Run every ready task, including ones posted while running
     */
    void run_pending() {
        io_.restart();
        io_.poll();
    }

    auto executor() -> boost::asio::any_io_executor { return io_.get_executor(); }

    boost::asio::io_context io_;
};

/**
 * @brief Fixture for temporary directory management
 */
class TempDirectoryFixture : public ExecutorFixture {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_drop_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

}  // namespace kcenon::file_drop::test

#endif  // KCENON_FILE_DROP_TEST_FIXTURES_H
