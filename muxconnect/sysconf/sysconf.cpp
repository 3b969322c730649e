//
//  sysconf.cpp
//  muxconnect
//

#include "sysconf.hpp"
#include <libgeneral/macros.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

plist_t sysconf_read_plist(const char *filePath){
    int fd = -1;
    char *fbuf = NULL;
    cleanup([&]{
        safeFree(fbuf);
        safeClose(fd);
    });
    struct stat finfo = {};

    retassure((fd = open(filePath, O_RDONLY))>=0, "Failed to read plist at path '%s'",filePath);
    assure(!fstat(fd, &finfo));
    retassure(finfo.st_size > 0, "plist at path '%s' is empty",filePath);

    assure(fbuf = (char*)malloc(finfo.st_size));

    assure(read(fd, fbuf, finfo.st_size) == finfo.st_size);

    {
        plist_t pl = NULL;
        plist_from_memory(fbuf, (uint32_t)finfo.st_size, &pl, NULL);
        retassure(pl, "failed to parse plist at path '%s'",filePath);
        return pl;
    }
}

static bool sysconf_try_get_milliseconds(plist_t p_config, const char *key, std::chrono::milliseconds *val){
    plist_t p_val = NULL;
    uint64_t intval = 0;

    if (!(p_val = plist_dict_get_item(p_config, key))) return false;
    if (plist_get_node_type(p_val) != PLIST_UINT) {
        warning("Ignoring config key %s, expected an integer",key);
        return false;
    }
    plist_get_uint_val(p_val, &intval);
    *val = std::chrono::milliseconds{intval};
    return true;
}

#pragma mark config
Config::Config() :
//config
socketPath(MUXCONNECT_DEFAULT_SOCKET_PATH),
connectTimeout(kDeviceConnectTimeout),
discoveryGracePeriod(kDeviceDetectTime),
//commandline
useSyslog(false),
debugLevel(0)
{
    //empty
}

void Config::load(const std::string &configPath){
    plist_t p_config = NULL;
    cleanup([&]{
        safeFreeCustom(p_config, plist_free);
    });

    try {
        p_config = sysconf_read_plist(configPath.c_str());
        retassure(plist_get_node_type(p_config) == PLIST_DICT, "config at '%s' is not a dictionary",configPath.c_str());
    } catch (tihmstar::exception &e) {
        info("Not loading config from %s (%s), using defaults",configPath.c_str(),e.what());
        applyEnvironment();
        return;
    }

    {
        plist_t p_socketPath = NULL;
        const char *str = NULL;
        uint64_t str_len = 0;
        if ((p_socketPath = plist_dict_get_item(p_config, "SocketPath"))) {
            if ((str = plist_get_string_ptr(p_socketPath, &str_len))) {
                socketPath = std::string(str,str_len);
            } else {
                warning("Ignoring config key SocketPath, expected a string");
            }
        }
    }
    sysconf_try_get_milliseconds(p_config, "ConnectTimeout", &connectTimeout);
    sysconf_try_get_milliseconds(p_config, "DiscoveryGracePeriod", &discoveryGracePeriod);

    applyEnvironment();
    info("Loaded config from %s",configPath.c_str());
}

void Config::applyEnvironment(){
    const char *addr = getenv(MUXCONNECT_SOCKET_ENV);
    if (!addr || !*addr) return;

    std::string val = addr;
    if (val.rfind("UNIX:", 0) == 0) {
        val = val.substr(sizeof("UNIX:")-1);
    }
    retassure(val.size() && val[0] == '/', "%s=%s is not a UNIX socket path",MUXCONNECT_SOCKET_ENV,addr);
    debug("socket path overridden by %s: %s",MUXCONNECT_SOCKET_ENV,val.c_str());
    socketPath = val;
}

ConnectorConfig Config::connectorConfig() const{
    return {connectTimeout, discoveryGracePeriod};
}
