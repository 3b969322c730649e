//
//  muxconnect-proto.h
//  muxconnect
//

#ifndef muxconnect_proto_h
#define muxconnect_proto_h

#ifdef __cplusplus
extern "C"{
#endif
    
#include <stdint.h>

#define MUXCONNECT_PROTO_VERSION 1
#define MUXCONNECT_LIBUSBMUX_VERSION 3
#define MUXCONNECT_MAX_PACKET_SIZE 0x20000
    
    enum usbmuxd_result {
        RESULT_OK = 0,
        RESULT_BADCOMMAND = 1,
        RESULT_BADDEV = 2,
        RESULT_CONNREFUSED = 3,
        // ???
        // ???
        RESULT_BADVERSION = 6,
    };
    
    struct usbmuxd_header {
        uint32_t length;    // length of message, including header
        uint32_t version;   // protocol version
        uint32_t message;   // message type
        uint32_t tag;       // responses to this query will echo back this tag
    } __attribute__((__packed__));
    
    enum usbmuxd_msgtype {
        MESSAGE_RESULT  = 1,
        MESSAGE_CONNECT = 2,
        MESSAGE_LISTEN = 3,
        MESSAGE_DEVICE_ADD = 4,
        MESSAGE_DEVICE_REMOVE = 5,
        MESSAGE_DEVICE_PAIRED = 6,
        //???
        MESSAGE_PLIST = 8,
    };
    
#ifdef __cplusplus
};
#endif

#endif /* muxconnect_proto_h */
