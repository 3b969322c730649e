//
//  DeviceObservers.hpp
//  muxconnect
//

#ifndef DeviceObservers_hpp
#define DeviceObservers_hpp

#include <stdint.h>
#include <functional>
#include <map>
#include <mutex>
#include <string>

struct DeviceNotification{
    enum notification_type{
        DEVICE_ATTACHED = 0,
        DEVICE_DETACHED
    };
    notification_type type;
    std::string serial; //empty for DEVICE_DETACHED
    uint32_t deviceID;
};

class DeviceObservers{
public:
    using observer_t = std::function<void(const DeviceNotification &note)>;
private:
    std::mutex _observersLck;
    std::map<uint64_t, observer_t> _observers;
    uint64_t _nextToken;

public:
    DeviceObservers();
    DeviceObservers(const DeviceObservers&) = delete;

    //returns a token for removeObserver
    uint64_t addObserver(observer_t observer);
    bool removeObserver(uint64_t token) noexcept;
    size_t count() noexcept;

    //observers are called on the publishing thread, without any lock held
    void publish(const DeviceNotification &note) noexcept;
    void publishAttached(const std::string &serial, uint32_t deviceID) noexcept;
    void publishDetached(uint32_t deviceID) noexcept;
};

#endif /* DeviceObservers_hpp */
