/**
 * @file device_list.cpp
 * @brief DeviceList implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/device_list.h"
#include "usbkit/gsl.hpp"

#include <utility>

namespace usbkit {

DeviceList::DeviceList(Context context, nal::RawDevice** list, size_t count) noexcept
    : context_(std::move(context))
    , list_(list)
    , count_(count)
{}

DeviceList::~DeviceList() {
    release();
}

DeviceList::DeviceList(DeviceList&& other) noexcept
    : context_(other.context_)
    , list_(std::exchange(other.list_, nullptr))
    , count_(std::exchange(other.count_, 0))
{}

DeviceList& DeviceList::operator=(DeviceList&& other) noexcept {
    if (this != &other) {
        release();
        context_ = other.context_;
        list_ = std::exchange(other.list_, nullptr);
        count_ = std::exchange(other.count_, 0);
    }
    return *this;
}

void DeviceList::release() noexcept {
    if (list_) {
        context_.library().freeDeviceList(list_, true);
        list_ = nullptr;
        count_ = 0;
    }
}

Device DeviceList::operator[](size_t index) const {
    gsl_Expects(index < count_);
    return Device(context_, list_[index]);
}

std::optional<Device> DeviceList::get(size_t index) const {
    if (index >= count_) {
        return std::nullopt;
    }
    return Device(context_, list_[index]);
}

} // namespace usbkit
