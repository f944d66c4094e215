#ifndef DYNSCOPE_SCOPE_UNIT_STATE_H
#define DYNSCOPE_SCOPE_UNIT_STATE_H

#include <dynscope/scope/binding_frame.h>

#include <array>
#include <string_view>

namespace dynscope {

    /**
     * How a frame became current on an execution unit.
     */
    enum class FrameTransition : uint8_t {
        PUSH = 0,         // run / call with a carrier
        SNAPSHOT = 1,     // run_with_snapshot / call_with_snapshot
        CONTINUATION = 2, // run_with_continuation / call_with_continuation
    };

    DYNSCOPE_EXPORT std::string_view to_string(FrameTransition transition);

    /**
     * ResolutionCache - Small direct-mapped memo of key lookups against the unit's current frame.
     *
     * Entries are only valid for the epoch they were stored under; the unit bumps its epoch on every frame change,
     * which invalidates the whole cache lazily on the next lookup. Both hits and misses (unbound keys) are cached.
     */
    class DYNSCOPE_EXPORT ResolutionCache {
    public:
        static constexpr size_t SLOTS = 16;

        [[nodiscard]] bool lookup(uint64_t epoch, uint64_t key_id, const Value *&value) noexcept;

        void store(uint64_t epoch, uint64_t key_id, const Value *value) noexcept;

        void clear() noexcept;

        [[nodiscard]] uint64_t hits() const noexcept { return _hits; }
        [[nodiscard]] uint64_t misses() const noexcept { return _misses; }

    private:
        struct Entry {
            uint64_t key_id{0};
            const Value *value{nullptr};
        };

        void reset_to(uint64_t epoch) noexcept;

        std::array<Entry, SLOTS> _entries{};
        uint64_t _epoch{0};
        uint64_t _hits{0};
        uint64_t _misses{0};
    };

    namespace detail {
        struct FrameSwap;
    }

    /**
     * ExecutionUnitState - The single mutable current-frame pointer of an execution unit.
     *
     * Every thread owns one, created on first use and starting at the root (empty) frame. It is read and written
     * only by its own thread, and only the scope runner protocol (run/call and the snapshot / continuation variants)
     * changes the frame, always in matched install/restore pairs.
     */
    class DYNSCOPE_EXPORT ExecutionUnitState {
    public:
        [[nodiscard]] static ExecutionUnitState &current() noexcept;

        [[nodiscard]] const BindingFrame::ptr &frame() const noexcept { return _frame; }

        /**
         * Incremented on every frame change.
         */
        [[nodiscard]] uint64_t epoch() const noexcept { return _epoch; }

        [[nodiscard]] ResolutionCache &cache() noexcept { return _cache; }

        ExecutionUnitState(const ExecutionUnitState &) = delete;
        ExecutionUnitState &operator=(const ExecutionUnitState &) = delete;

    private:
        ExecutionUnitState() = default;

        [[nodiscard]] BindingFrame::ptr install(BindingFrame::ptr frame, FrameTransition transition);

        void restore(BindingFrame::ptr previous, FrameTransition transition) noexcept;

        friend struct detail::FrameSwap;

        BindingFrame::ptr _frame;
        uint64_t _epoch{1};
        ResolutionCache _cache;
    };

    namespace detail {
        // The only path through which a frame becomes current, used by the scope runner templates.
        struct DYNSCOPE_EXPORT FrameSwap {
            [[nodiscard]] static BindingFrame::ptr enter(ExecutionUnitState &unit, BindingFrame::ptr frame,
                                                         FrameTransition transition) {
                return unit.install(std::move(frame), transition);
            }

            static void leave(ExecutionUnitState &unit, BindingFrame::ptr previous, FrameTransition transition) noexcept {
                unit.restore(std::move(previous), transition);
            }
        };
    } // namespace detail

    /**
     * The calling unit's current frame, null at the root.
     */
    [[nodiscard]] inline const BindingFrame::ptr &current_frame() noexcept { return ExecutionUnitState::current().frame(); }

} // namespace dynscope

#endif // DYNSCOPE_SCOPE_UNIT_STATE_H
