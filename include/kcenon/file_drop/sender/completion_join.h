/**
 * @file completion_join.h
 * @brief Fan-in of per-file outcomes into one drop outcome
 */

#ifndef KCENON_FILE_DROP_SENDER_COMPLETION_JOIN_H
#define KCENON_FILE_DROP_SENDER_COMPLETION_JOIN_H

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "kcenon/file_drop/sender/sender_types.h"

namespace kcenon::file_drop {

/**
 * @brief Countdown join with fail-fast semantics
 *
 * Holds one slot per file. The join settles as done once every slot has
 * resolved, or as failed on the first rejection. After it settles, further
 * resolutions and rejections are ignored, so a late success never turns a
 * failed drop into a done one. A join with zero slots settles on start().
 */
class completion_join {
public:
    using settled_callback = std::function<void(const drop_outcome&)>;

    explicit completion_join(std::size_t slots);

    /**
     * @brief Set the callback fired once when the join settles
     */
    void on_settled(settled_callback callback);

    /**
     * @brief Settle an empty join; no effect otherwise
     */
    void start();

    /**
     * @brief Mark one slot as resolved
     * @return false if the slot is out of range or was already decided
     */
    auto resolve(std::size_t slot) -> bool;

    /**
     * @brief Mark one slot as rejected
     * @return false if the slot is out of range or was already decided
     */
    auto reject(std::size_t slot, drop_failure failure) -> bool;

    [[nodiscard]] auto is_settled() const noexcept -> bool { return outcome_.has_value(); }

    [[nodiscard]] auto outcome() const -> const std::optional<drop_outcome>& { return outcome_; }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return remaining_; }

private:
    enum class slot_state { pending, resolved, rejected };

    auto decide(std::size_t slot, slot_state state) -> bool;
    void settle(drop_outcome outcome);

    std::vector<slot_state> slots_;
    std::size_t remaining_;
    std::optional<drop_outcome> outcome_;
    settled_callback callback_;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_SENDER_COMPLETION_JOIN_H
