/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// Typed reference into a HandlePool. A default-constructed handle is "none".
template <typename Tag> struct Handle {
    uint32_t slot = UINT32_MAX;
    uint32_t generation = 0;

    bool valid() const { return slot != UINT32_MAX; }

    friend bool operator==(const Handle &, const Handle &) = default;
};

struct ImageTag;
struct ImageViewTag;
struct MemoryTag;
struct BufferTag;
struct RenderPassTag;
struct FramebufferTag;
struct SwapchainTag;
struct SemaphoreTag;
struct FenceTag;
struct CommandBufferTag;

using ImageHandle = Handle<ImageTag>;
using ImageViewHandle = Handle<ImageViewTag>;
using MemoryHandle = Handle<MemoryTag>;
using BufferHandle = Handle<BufferTag>;
using RenderPassHandle = Handle<RenderPassTag>;
using FramebufferHandle = Handle<FramebufferTag>;
using SwapchainHandle = Handle<SwapchainTag>;
using SemaphoreHandle = Handle<SemaphoreTag>;
using FenceHandle = Handle<FenceTag>;
using CommandBufferHandle = Handle<CommandBufferTag>;

// Slot arena with per-slot generations. Releasing a slot bumps its generation,
// so every handle that pointed at the old occupant stops resolving.
template <typename Tag, typename T> class HandlePool {
public:
    using handle_type = Handle<Tag>;

    handle_type insert(T value) {
        uint32_t slot;
        if (!free_.empty()) {
            slot = free_.back();
            free_.pop_back();
        } else {
            slot = static_cast<uint32_t>(entries_.size());
            entries_.emplace_back();
        }
        auto &e = entries_[slot];
        e.value = std::move(value);
        e.live = true;
        live_++;
        return handle_type{slot, e.generation};
    }

    bool alive(handle_type h) const {
        return h.slot < entries_.size() && entries_[h.slot].live && entries_[h.slot].generation == h.generation;
    }

    T *get(handle_type h) { return alive(h) ? &entries_[h.slot].value : nullptr; }
    const T *get(handle_type h) const { return alive(h) ? &entries_[h.slot].value : nullptr; }

    std::optional<T> take(handle_type h) {
        if (!alive(h)) {
            return std::nullopt;
        }
        auto &e = entries_[h.slot];
        std::optional<T> out{std::move(e.value)};
        e.value = T{};
        e.live = false;
        e.generation++;
        free_.push_back(h.slot);
        live_--;
        return out;
    }

    size_t live_count() const { return live_; }

    // Visits every live entry; used to release leftovers at shutdown.
    template <typename F> void for_each(F &&f) {
        for (uint32_t i = 0; i < entries_.size(); i++) {
            if (entries_[i].live) {
                f(handle_type{i, entries_[i].generation}, entries_[i].value);
            }
        }
    }

private:
    struct Entry {
        T value{};
        uint32_t generation = 1;
        bool live = false;
    };

    std::vector<Entry> entries_;
    std::vector<uint32_t> free_;
    size_t live_ = 0;
};
