//
//  sysconf.hpp
//  muxconnect
//

#ifndef sysconf_hpp
#define sysconf_hpp

#include "../Connector/DeviceConnector.hpp"

#include <plist/plist.h>
#include <chrono>
#include <iostream>

#ifndef SYSCONF_DIR
#   define SYSCONF_DIR "/etc"
#endif

#define MUXCONNECT_DEFAULT_SOCKET_PATH "/var/run/usbmuxd"
#define MUXCONNECT_DEFAULT_CONFIG_PATH SYSCONF_DIR "/muxconnect.plist"
#define MUXCONNECT_SOCKET_ENV "USBMUXD_SOCKET_ADDRESS"

plist_t sysconf_read_plist(const char *filePath);

class Config{
public:
    //config
    std::string socketPath;
    std::chrono::milliseconds connectTimeout;
    std::chrono::milliseconds discoveryGracePeriod;

    //commandline
    bool useSyslog;
    int debugLevel;

    Config();
    /*
     Missing keys keep their current value. A missing or unreadable file is not an error.
     USBMUXD_SOCKET_ADDRESS overrides the socket path afterwards.
     */
    void load(const std::string &configPath = MUXCONNECT_DEFAULT_CONFIG_PATH);
    void applyEnvironment();

    ConnectorConfig connectorConfig() const;
};

#endif /* sysconf_hpp */
