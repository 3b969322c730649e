//
//  DeviceObservers.cpp
//  muxconnect
//

#include "DeviceObservers.hpp"
#include <libgeneral/macros.h>

#include <vector>

DeviceObservers::DeviceObservers()
: _nextToken(1)
{
    //
}

uint64_t DeviceObservers::addObserver(observer_t observer){
    retassure(observer, "refusing to add empty observer");
    std::unique_lock<std::mutex> ul(_observersLck);
    uint64_t token = _nextToken++;
    _observers[token] = observer;
    return token;
}

bool DeviceObservers::removeObserver(uint64_t token) noexcept{
    std::unique_lock<std::mutex> ul(_observersLck);
    return _observers.erase(token) != 0;
}

size_t DeviceObservers::count() noexcept{
    std::unique_lock<std::mutex> ul(_observersLck);
    return _observers.size();
}

void DeviceObservers::publish(const DeviceNotification &note) noexcept{
    std::vector<observer_t> observers;
    {
        std::unique_lock<std::mutex> ul(_observersLck);
        for (auto &o : _observers) observers.push_back(o.second);
    }
    debug("publishing notification type=%d deviceID=%u to %zu observers",note.type,note.deviceID,observers.size());
    for (auto &o : observers) {
        try {
            o(note);
        } catch (tihmstar::exception &e) {
            warning("observer failed to handle notification with error=%d (%s)",e.code(),e.what());
        } catch (std::exception &e) {
            warning("observer failed to handle notification (%s)",e.what());
        }
    }
}

void DeviceObservers::publishAttached(const std::string &serial, uint32_t deviceID) noexcept{
    publish({DeviceNotification::DEVICE_ATTACHED, serial, deviceID});
}

void DeviceObservers::publishDetached(uint32_t deviceID) noexcept{
    publish({DeviceNotification::DEVICE_DETACHED, {}, deviceID});
}
