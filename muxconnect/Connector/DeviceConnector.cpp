//
//  DeviceConnector.cpp
//  muxconnect
//

#include "DeviceConnector.hpp"
#include "../MUXConnectException.hpp"
#include "../Packet/MuxPacket.hpp"
#include <libgeneral/macros.h>

#include <future>
#include <thread>

namespace {
struct phase_result{
    bool ok;
    std::string message;
    uint64_t resultNumber;
};

ConnectResult connectFailure(connect_error err, const tihmstar::exception &e) noexcept{
    error("connect failed (%s): %s",connect_error_str(err),e.what());
    return {-1, err, e.what()};
}
}

const char *connect_error_str(connect_error err) noexcept{
    switch (err) {
        case CONNERR_OK:                            return "OK";
        case CONNERR_DEVICE_NOT_FOUND:              return "DeviceNotFound";
        case CONNERR_CHANNEL_CONSTRUCTION_FAILED:   return "ChannelConstructionFailed";
        case CONNERR_SEND_FAILED:                   return "SendFailed";
        case CONNERR_SEND_TIMEDOUT:                 return "SendTimedOut";
        case CONNERR_RECEIVE_FAILED:                return "ReceiveFailed";
        case CONNERR_RECEIVE_TIMEDOUT:              return "ReceiveTimedOut";
        case CONNERR_CONNECTION_REFUSED:            return "ConnectionRefused";
        case CONNERR_UNKNOWN:                       return "Unknown";
    }
    return "Unknown";
}

#pragma mark DeviceConnector
DeviceConnector::DeviceConnector(std::shared_ptr<BroadcastDetector> detector, ChannelFactory channelFactory, ConnectorConfig config)
: _detector(detector), _channelFactory(channelFactory), _config(config)
{
    retassure(_detector, "DeviceConnector requires a detector");
    retassure(_channelFactory, "DeviceConnector requires a channel factory");
    debug("DeviceConnector connectTimeout=%lldms discoveryGracePeriod=%lldms",
          (long long)_config.connectTimeout.count(), (long long)_config.discoveryGracePeriod.count());
}

DeviceConnector::~DeviceConnector(){
    //the handler points back at us
    if (_registry.isListening()) {
        _detector->cancel();
    }
}

#pragma mark public API
std::set<std::string> DeviceConnector::connectedDevices(){
    if (!_registry.isListening()) {
        DeviceRegistry::activation act = startListening();
        if (act.didActivate) {
            //wait for a short time to detect all connected devices when listening just started
            debug("listening started, waiting %lldms for devices to show up",(long long)_config.discoveryGracePeriod.count());
            std::this_thread::sleep_for(_config.discoveryGracePeriod);
        } else if (!act.success) {
            warning("Failed to start listening for devices");
        }
    }
    return _registry.snapshotSerials();
}

ConnectResult DeviceConnector::connectToDevice(const std::string &serial, uint16_t port) noexcept{
    try {
        int fd = connect(serial, port);
        info("Connected to device %s on port %u (fd=%d)",serial.c_str(),port,fd);
        return {fd, CONNERR_OK, {}};
    } catch (tihmstar::MUXConnectException_device_not_found &e) {
        return connectFailure(CONNERR_DEVICE_NOT_FOUND, e);
    } catch (tihmstar::MUXConnectException_channel_construction_failed &e) {
        return connectFailure(CONNERR_CHANNEL_CONSTRUCTION_FAILED, e);
    } catch (tihmstar::MUXConnectException_send_timedout &e) {
        return connectFailure(CONNERR_SEND_TIMEDOUT, e);
    } catch (tihmstar::MUXConnectException_send_failed &e) {
        return connectFailure(CONNERR_SEND_FAILED, e);
    } catch (tihmstar::MUXConnectException_receive_timedout &e) {
        return connectFailure(CONNERR_RECEIVE_TIMEDOUT, e);
    } catch (tihmstar::MUXConnectException_receive_failed &e) {
        return connectFailure(CONNERR_RECEIVE_FAILED, e);
    } catch (tihmstar::MUXConnectException_connection_refused &e) {
        return connectFailure(CONNERR_CONNECTION_REFUSED, e);
    } catch (tihmstar::exception &e) {
        return connectFailure(CONNERR_UNKNOWN, e);
    } catch (std::exception &e) {
        error("connect failed (%s): %s",connect_error_str(CONNERR_UNKNOWN),e.what());
        return {-1, CONNERR_UNKNOWN, e.what()};
    }
}

#pragma mark registry
bool DeviceConnector::ensureListening(){
    return startListening().success;
}

std::set<std::string> DeviceConnector::snapshotDeviceSerials(){
    return _registry.snapshotSerials();
}

void DeviceConnector::applyEvent(const BroadcastEvent &event) noexcept{
    switch (event.type) {
        case BroadcastEvent::EVENT_ATTACHED:
            info("Device %s attached with id %u",event.serial.c_str(),event.deviceID);
            _registry.upsert(event.serial, event.deviceID);
            _observers.publishAttached(event.serial, event.deviceID);
            break;
        case BroadcastEvent::EVENT_DETACHED:
        {
            size_t removed = _registry.removeDeviceID(event.deviceID);
            info("Device with id %u detached (%zu entries removed)",event.deviceID,removed);
            _observers.publishDetached(event.deviceID);
            break;
        }
        default:
            warning("Unhandled broadcast message: %s",event.raw.c_str());
            break;
    }
}

#pragma mark private
DeviceRegistry::activation DeviceConnector::startListening(){
    return _registry.ensureListening([this]{
        return _detector->listen([this](const BroadcastEvent *event, const tihmstar::exception *err){
            handleBroadcast(event, err);
        });
    });
}

void DeviceConnector::handleBroadcast(const BroadcastEvent *event, const tihmstar::exception *err) noexcept{
    if (err) {
        _detector->cancel();
        error("Failed to listen to broadcast from usbmuxd with error=%d (%s)",err->code(),err->what());
        return;
    }
    if (event) applyEvent(*event);
}

int DeviceConnector::connect(const std::string &serial, uint16_t port){
    plist_t p_req = NULL;
    cleanup([&]{
        safeFreeCustom(p_req, plist_free);
    });
    std::unique_ptr<Channel> channel;
    uint32_t deviceID = 0;

    if (!connectedDevices().count(serial) || !_registry.idForSerial(serial, &deviceID)) {
        retcustomerror(MUXConnectException_device_not_found, "Device %s is not detected", serial.c_str());
    }
    assure(p_req = mux_connect_packet(deviceID, port));

    try {
        channel = _channelFactory();
    } catch (tihmstar::exception &e) {
        retcustomerror(MUXConnectException_channel_construction_failed, "Failed to open channel with error=%d (%s)", e.code(), e.what());
    }
    if (!channel) {
        retcustomerror(MUXConnectException_channel_construction_failed, "Channel factory returned no channel");
    }

    {
        auto done = std::make_shared<std::promise<phase_result>>();
        std::future<phase_result> f = done->get_future();
        try {
            channel->sendPacket(p_req, [done](const tihmstar::exception *err){
                if (err) {
                    done->set_value({false, err->what(), 0});
                } else {
                    done->set_value({true, {}, 0});
                }
            });
        } catch (tihmstar::exception &e) {
            retcustomerror(MUXConnectException_send_failed, "Failed to send connect packet with error=%d (%s)", e.code(), e.what());
        }
        if (f.wait_for(_config.connectTimeout) == std::future_status::timeout) {
            retcustomerror(MUXConnectException_send_timedout, "Sending connect packet for device %s timed out", serial.c_str());
        }
        phase_result res = f.get();
        if (!res.ok) {
            retcustomerror(MUXConnectException_send_failed, "Failed to send connect packet: %s", res.message.c_str());
        }
    }

    {
        auto done = std::make_shared<std::promise<phase_result>>();
        std::future<phase_result> f = done->get_future();
        try {
            channel->receivePacket([done](plist_t packet, const tihmstar::exception *err){
                if (err) {
                    done->set_value({false, err->what(), 0});
                    return;
                }
                try {
                    done->set_value({true, {}, mux_result_number(packet)});
                } catch (tihmstar::exception &e) {
                    done->set_value({false, e.what(), 0});
                }
            });
        } catch (tihmstar::exception &e) {
            retcustomerror(MUXConnectException_receive_failed, "Failed to receive connect reply with error=%d (%s)", e.code(), e.what());
        }
        if (f.wait_for(_config.connectTimeout) == std::future_status::timeout) {
            retcustomerror(MUXConnectException_receive_timedout, "Waiting for connect reply from device %s timed out", serial.c_str());
        }
        phase_result res = f.get();
        if (!res.ok) {
            retcustomerror(MUXConnectException_receive_failed, "Failed to receive connect reply: %s", res.message.c_str());
        }
        if (res.resultNumber != RESULT_OK) {
            retcustomerror(MUXConnectException_connection_refused, "Device %s refused connection to port %u (result=%llu)",
                           serial.c_str(), port, (unsigned long long)res.resultNumber);
        }
    }

    return channel->releaseFd();
}
