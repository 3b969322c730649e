//
//  DeviceConnector.hpp
//  muxconnect
//

#ifndef DeviceConnector_hpp
#define DeviceConnector_hpp

#include "DeviceRegistry.hpp"
#include "DeviceObservers.hpp"
#include "../Channel/Channel.hpp"
#include "../Detector/BroadcastDetector.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>

/** Timeout for each phase of connecting to a device. */
static constexpr std::chrono::milliseconds kDeviceConnectTimeout{5000};
/** Time to detect already connected devices when listening starts. */
static constexpr std::chrono::milliseconds kDeviceDetectTime{2000};

struct ConnectorConfig{
    std::chrono::milliseconds connectTimeout = kDeviceConnectTimeout;
    std::chrono::milliseconds discoveryGracePeriod = kDeviceDetectTime;
};

enum connect_error{
    CONNERR_OK = 0,
    CONNERR_DEVICE_NOT_FOUND,
    CONNERR_CHANNEL_CONSTRUCTION_FAILED,
    CONNERR_SEND_FAILED,
    CONNERR_SEND_TIMEDOUT,
    CONNERR_RECEIVE_FAILED,
    CONNERR_RECEIVE_TIMEDOUT,
    CONNERR_CONNECTION_REFUSED,
    CONNERR_UNKNOWN
};

const char *connect_error_str(connect_error err) noexcept;

struct ConnectResult{
    int fd; //owned by the caller, -1 on error
    connect_error err;
    std::string message;
};

class DeviceConnector{
    std::shared_ptr<BroadcastDetector> _detector;
    ChannelFactory _channelFactory;
    ConnectorConfig _config;
    DeviceRegistry _registry;
    DeviceObservers _observers;

    DeviceRegistry::activation startListening();
    void handleBroadcast(const BroadcastEvent *event, const tihmstar::exception *err) noexcept;
    int connect(const std::string &serial, uint16_t port);

public:
    DeviceConnector(std::shared_ptr<BroadcastDetector> detector, ChannelFactory channelFactory, ConnectorConfig config = {});
    DeviceConnector(const DeviceConnector &) = delete;
    DeviceConnector(DeviceConnector &&) = delete;
    ~DeviceConnector();

#pragma mark public API
    /*
     Starts listening on first use. The call that starts listening blocks for the discovery grace period
     so already attached devices get reported before the result is taken.
     */
    std::set<std::string> connectedDevices();

    /*
     Opens a stream to port on the device with the given serial.
     Never throws; on failure fd is -1 and err/message describe the failure.
     */
    ConnectResult connectToDevice(const std::string &serial, uint16_t port) noexcept;

    DeviceObservers &observers() noexcept {return _observers;};

#pragma mark registry
    bool ensureListening();
    std::set<std::string> snapshotDeviceSerials();
    void applyEvent(const BroadcastEvent &event) noexcept;
};

#endif /* DeviceConnector_hpp */
