// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <screen/BufferStack.hpp>
#include <screen/Compositor.hpp>
#include <screen/Minibuffer.hpp>
#include <screen/ScreenConfig.hpp>
#include <screen/View.hpp>
#include <tui/Surface.hpp>

#include <memory>
#include <string_view>
#include <type_traits>
#include <variant>

namespace bufstack
{

/// @brief The collaborators a nested input loop works with.
struct LoopContext
{
    tui::Surface& surface;
    BufferStack& stack;
    Minibuffer& minibuffer;
    Compositor& compositor;
    ScreenConfig const& config;
};

/// @brief Spawns @p view and runs a blocking input loop until it is done or the cancel key is hit.
///
/// Keystrokes go to the view; every handled event is followed by a compositor
/// pass. The buffer is killed on exit and the view's value is returned, also on
/// cancellation. Loops nest: a modal may be started from inside another loop.
template <typename T>
[[nodiscard]] auto runModal(LoopContext const& context,
                            std::string_view title,
                            std::unique_ptr<ModalView<T>> view,
                            SpawnOptions const& options = {}) -> Result<T>
{
    auto* modal = view.get();
    auto spawned = context.stack.spawn(title, std::move(view), options);
    if (!spawned)
        return std::unexpected(spawned.error());

    auto* buffer = *spawned;
    log::debug("Entering modal loop for '{}'", buffer->title());
    context.compositor.drawScreen();

    while (!modal->done())
    {
        auto const event = context.surface.poll(context.config.pollTimeoutMs);
        if (!event)
            continue;

        if (std::holds_alternative<tui::ResizeEvent>(*event))
        {
            context.stack.markDirty();
            context.compositor.drawScreen();
            continue;
        }

        auto const& key = std::get<tui::KeyEvent>(*event);
        if (key == context.config.cancelKey)
            break;

        if (modal->handleInput(key))
            buffer->markDirty();
        context.compositor.drawScreen();
        context.minibuffer.eraseFlash();
    }

    auto result = modal->value();
    if (auto killed = context.stack.killBuffer(*buffer); !killed)
        return std::unexpected(killed.error());
    return result;
}

} // namespace bufstack
