#pragma once

#include <type_traits>

namespace codegrader {

/**
 * \brief A trivially-movable, but non-copyable type.
 *
 * Use as a superclass to annotate a subclass as non-copyable.
 */
class NonCopyable
{
public:
    NonCopyable() = default;

    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;

    ~NonCopyable() = default;
};

static_assert(!std::is_copy_constructible_v<NonCopyable> && std::is_trivially_move_constructible_v<NonCopyable>);

/**
 * \brief A non-movable and non-copyable type.
 *
 * Used for anything that other threads hold references to (pools, gates, servers).
 */
class NonMovable : public NonCopyable
{
public:
    NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;

    ~NonMovable() = default;
};

static_assert(!std::is_move_constructible_v<NonMovable> && !std::is_copy_assignable_v<NonMovable>);

} // namespace codegrader
