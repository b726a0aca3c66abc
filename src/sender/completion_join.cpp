/**
 * @file completion_join.cpp
 * @brief Implementation of completion_join
 */

#include "kcenon/file_drop/sender/completion_join.h"

#include <utility>

namespace kcenon::file_drop {

completion_join::completion_join(std::size_t slots)
    : slots_(slots, slot_state::pending), remaining_(slots) {}

void completion_join::on_settled(settled_callback callback) {
    callback_ = std::move(callback);
}

void completion_join::start() {
    if (slots_.empty() && !outcome_) {
        settle(drop_outcome{drop_status::done, std::nullopt});
    }
}

auto completion_join::resolve(std::size_t slot) -> bool {
    if (!decide(slot, slot_state::resolved)) {
        return false;
    }
    if (remaining_ == 0 && !outcome_) {
        settle(drop_outcome{drop_status::done, std::nullopt});
    }
    return true;
}

auto completion_join::reject(std::size_t slot, drop_failure failure) -> bool {
    if (!decide(slot, slot_state::rejected)) {
        return false;
    }
    if (!outcome_) {
        settle(drop_outcome{drop_status::failed, std::move(failure)});
    }
    return true;
}

auto completion_join::decide(std::size_t slot, slot_state state) -> bool {
    if (slot >= slots_.size() || slots_[slot] != slot_state::pending) {
        return false;
    }
    slots_[slot] = state;
    --remaining_;
    return true;
}

void completion_join::settle(drop_outcome outcome) {
    outcome_ = std::move(outcome);
    if (callback_) {
        auto callback = std::move(callback_);
        callback_ = nullptr;
        callback(*outcome_);
    }
}

}  // namespace kcenon::file_drop
