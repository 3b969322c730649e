//
//  DeviceRegistry.cpp
//  muxconnect
//

#include "DeviceRegistry.hpp"
#include <libgeneral/macros.h>

DeviceRegistry::DeviceRegistry()
: _listenState(LISTEN_IDLE)
{
    //
}

#pragma mark listening
DeviceRegistry::activation DeviceRegistry::ensureListening(const std::function<bool()> &subscribe){
    std::promise<bool> attempt;
    {
        std::unique_lock<std::mutex> ul(_syncLck);
        switch (_listenState) {
            case LISTEN_ACTIVE:
                return {true, false};
            case LISTEN_ACTIVATING:
            {
                std::shared_future<bool> inflight = _activation;
                ul.unlock();
                debug("joining in-flight listen activation");
                return {inflight.get(), false};
            }
            case LISTEN_IDLE:
                _listenState = LISTEN_ACTIVATING;
                _activation = attempt.get_future().share();
                break;
        }
    }

    bool success = false;
    try {
        success = subscribe();
    } catch (tihmstar::exception &e) {
        error("listen activation failed with error=%d (%s)",e.code(),e.what());
        success = false;
    } catch (std::exception &e) {
        error("listen activation failed (%s)",e.what());
        success = false;
    }

    {
        std::unique_lock<std::mutex> ul(_syncLck);
        _listenState = success ? LISTEN_ACTIVE : LISTEN_IDLE;
        _activation = {};
    }
    attempt.set_value(success);
    return {success, success};
}

bool DeviceRegistry::isListening() noexcept{
    std::unique_lock<std::mutex> ul(_syncLck);
    return _listenState == LISTEN_ACTIVE;
}

#pragma mark devices
void DeviceRegistry::upsert(const std::string &serial, uint32_t deviceID){
    std::unique_lock<std::mutex> ul(_syncLck);
    _devices[serial] = deviceID;
}

size_t DeviceRegistry::removeDeviceID(uint32_t deviceID) noexcept{
    size_t removed = 0;
    std::unique_lock<std::mutex> ul(_syncLck);
    for (auto it = _devices.begin(); it != _devices.end();) {
        if (it->second == deviceID) {
            it = _devices.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

bool DeviceRegistry::idForSerial(const std::string &serial, uint32_t *deviceID) noexcept{
    std::unique_lock<std::mutex> ul(_syncLck);
    auto it = _devices.find(serial);
    if (it == _devices.end()) return false;
    if (deviceID) *deviceID = it->second;
    return true;
}

std::set<std::string> DeviceRegistry::snapshotSerials(){
    std::set<std::string> ret;
    std::unique_lock<std::mutex> ul(_syncLck);
    for (auto &d : _devices) {
        ret.insert(d.first);
    }
    return ret;
}

size_t DeviceRegistry::size() noexcept{
    std::unique_lock<std::mutex> ul(_syncLck);
    return _devices.size();
}
