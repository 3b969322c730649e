//
//  DeviceRegistry.hpp
//  muxconnect
//

#ifndef DeviceRegistry_hpp
#define DeviceRegistry_hpp

#include <stdint.h>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <string>

/*
 Mapping of device serial to the daemon assigned device ID, plus the listening state.
 Every access goes through _syncLck, so callers always see fully applied updates.
 */
class DeviceRegistry{
public:
    enum listen_state{
        LISTEN_IDLE = 0,
        LISTEN_ACTIVATING,
        LISTEN_ACTIVE
    };
    struct activation{
        bool success;
        bool didActivate; //true only for the caller whose attempt switched the state to LISTEN_ACTIVE
    };

private:
    std::mutex _syncLck;
    std::map<std::string, uint32_t> _devices;
    listen_state _listenState;
    std::shared_future<bool> _activation; //valid while LISTEN_ACTIVATING

public:
    DeviceRegistry();
    DeviceRegistry(const DeviceRegistry&) = delete;

#pragma mark listening
    /*
     The first caller runs subscribe() outside the lock.
     Callers arriving while that attempt is in flight wait for it and share its outcome.
     A failed attempt returns the state to LISTEN_IDLE.
     */
    activation ensureListening(const std::function<bool()> &subscribe);
    bool isListening() noexcept;

#pragma mark devices
    void upsert(const std::string &serial, uint32_t deviceID);
    size_t removeDeviceID(uint32_t deviceID) noexcept;
    bool idForSerial(const std::string &serial, uint32_t *deviceID) noexcept;
    std::set<std::string> snapshotSerials();
    size_t size() noexcept;
};

#endif /* DeviceRegistry_hpp */
