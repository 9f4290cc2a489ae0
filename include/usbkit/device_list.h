/**
 * @file device_list.h
 * @brief Owned result of one device enumeration.
 *
 * The list owns the native device array and the one reference each entry
 * holds. Every Device produced from the list takes its own reference, so it
 * stays valid after the list is destroyed.
 *
 * Example:
 * @code
 *   auto list = ctx.devices();
 *   for (const usbkit::Device& device : *list) {
 *       auto desc = device.device_descriptor();
 *       ...
 *   }
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/context.h"
#include "usbkit/device.h"
#include <cstddef>
#include <iterator>
#include <optional>

namespace usbkit {

class DeviceList {
public:
    /**
     * @brief Adopt a native device array.
     *
     * @param context Context the array was enumerated from
     * @param list Null-terminated array from getDeviceList (may be null when empty)
     * @param count Number of entries
     */
    DeviceList(Context context, nal::RawDevice** list, size_t count) noexcept;

    ~DeviceList();

    // Move-only (owns the native array)
    DeviceList(const DeviceList&) = delete;
    DeviceList& operator=(const DeviceList&) = delete;
    DeviceList(DeviceList&& other) noexcept;
    DeviceList& operator=(DeviceList&& other) noexcept;

    [[nodiscard]] size_t size() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    /**
     * @brief Device at an index.
     * @pre index < size()
     */
    [[nodiscard]] Device operator[](size_t index) const;

    /**
     * @brief Device at an index, or std::nullopt when out of range.
     */
    [[nodiscard]] std::optional<Device> get(size_t index) const;

    [[nodiscard]] const Context& context() const noexcept { return context_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Iteration
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Input iterator yielding a fresh Device per position.
     */
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Device;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Device;

        const_iterator() noexcept = default;
        const_iterator(const DeviceList* list, size_t index) noexcept
            : list_(list), index_(index) {}

        Device operator*() const { return (*list_)[index_]; }

        const_iterator& operator++() noexcept {
            ++index_;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            const_iterator tmp = *this;
            ++index_;
            return tmp;
        }

        friend bool operator==(const const_iterator& a, const const_iterator& b) noexcept {
            return a.list_ == b.list_ && a.index_ == b.index_;
        }

    private:
        const DeviceList* list_ = nullptr;
        size_t index_ = 0;
    };

    [[nodiscard]] const_iterator begin() const noexcept { return const_iterator(this, 0); }
    [[nodiscard]] const_iterator end() const noexcept { return const_iterator(this, count_); }

private:
    void release() noexcept;

    Context context_;
    nal::RawDevice** list_;
    size_t count_;
};

} // namespace usbkit
