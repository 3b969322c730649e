//
//  MuxPacket.cpp
//  muxconnect
//

#include "MuxPacket.hpp"
#include "../MUXConnectException.hpp"
#include <libgeneral/macros.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#ifndef PACKAGE_NAME
#   define PACKAGE_NAME "muxconnect"
#endif
#ifndef VERSION_STRING
#   define VERSION_STRING PACKAGE_NAME
#endif

static plist_t mux_request_packet(const char *messageType){
    plist_t p_req = NULL;
    assure(p_req = plist_new_dict());
    plist_dict_set_item(p_req, "MessageType", plist_new_string(messageType));
    plist_dict_set_item(p_req, "ClientVersionString", plist_new_string(VERSION_STRING));
    plist_dict_set_item(p_req, "ProgName", plist_new_string(PACKAGE_NAME));
    plist_dict_set_item(p_req, "kLibUSBMuxVersion", plist_new_uint(MUXCONNECT_LIBUSBMUX_VERSION));
    return p_req;
}

static void writeAll(int fd, const void *buf, size_t buflen){
    const char *ptr = (const char*)buf;
    while (buflen) {
        ssize_t didSend = send(fd, ptr, buflen, MSG_NOSIGNAL);
        if (didSend == -1 && errno == EINTR) continue;
        if (didSend <= 0) retcustomerror(MUXConnectException_disconnected, "send on fd %d failed: %s", fd, didSend == -1 ? strerror(errno) : "no progress");
        ptr += didSend;
        buflen -= didSend;
    }
}

static void readAll(int fd, void *buf, size_t buflen){
    char *ptr = (char*)buf;
    while (buflen) {
        ssize_t got = recv(fd, ptr, buflen, 0);
        if (got == -1 && errno == EINTR) continue;
        if (got == 0) {
            retcustomerror(MUXConnectException_disconnected, "fd %d disconnected!", fd);
        }
        retassure(got > 0, "recv on fd %d failed: %s", fd, strerror(errno));
        ptr += got;
        buflen -= got;
    }
}

#pragma mark socket
int mux_socket_connect(const std::string &socketPath){
    int fd = -1;
    cleanup([&]{
        safeClose(fd);
    });
    struct sockaddr_un addr = {};

    retassure(socketPath.size() < sizeof(addr.sun_path), "socket path '%s' is too long", socketPath.c_str());
    retassure((fd = socket(AF_UNIX, SOCK_STREAM, 0))>=0, "socket() failed: %s", strerror(errno));

    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path)-1);
    retassure(!::connect(fd, (struct sockaddr*)&addr, sizeof(addr)), "connect(%s) failed: %s", socketPath.c_str(), strerror(errno));

    {
        int ret = fd; fd = -1;
        return ret;
    }
}

#pragma mark requests
plist_t mux_listen_packet(){
    return mux_request_packet("Listen");
}

plist_t mux_connect_packet(uint32_t deviceID, uint16_t port){
    plist_t p_req = mux_request_packet("Connect");
    plist_dict_set_item(p_req, "DeviceID", plist_new_uint(deviceID));
    //usbmuxd expects the port in network byte order
    plist_dict_set_item(p_req, "PortNumber", plist_new_uint(htons(port)));
    return p_req;
}

#pragma mark framing
void mux_send_plist(int fd, uint32_t tag, const plist_t packet){
    char *xml = NULL;
    cleanup([&]{
        safeFree(xml);
    });
    uint32_t xmlsize = 0;

    plist_to_xml(packet, &xml, &xmlsize);
    retassure(xml && xmlsize, "Failed to serialize packet");
    retassure(sizeof(usbmuxd_header) + xmlsize <= MUXCONNECT_MAX_PACKET_SIZE, "packet too large (%u bytes)", xmlsize);

    struct usbmuxd_header hdr{
        .length = (uint32_t)(sizeof(hdr) + xmlsize),
        .version = MUXCONNECT_PROTO_VERSION,
        .message = MESSAGE_PLIST,
        .tag = tag
    };
    debug("mux_send_plist fd %d tag %d length %d", fd, tag, hdr.length);
    writeAll(fd, &hdr, sizeof(hdr));
    writeAll(fd, xml, xmlsize);
}

plist_t mux_recv_plist(int fd, uint32_t *tag){
    char *payload = NULL;
    cleanup([&]{
        safeFree(payload);
    });
    struct usbmuxd_header hdr = {};
    uint32_t payload_size = 0;
    plist_t p_ret = NULL;

    readAll(fd, &hdr, sizeof(hdr));
    debug("mux_recv_plist fd %d len %d ver %d msg %d tag %d", fd, hdr.length, hdr.version, hdr.message, hdr.tag);

    retassure(hdr.length >= sizeof(hdr), "message is too short for header (%u bytes)", hdr.length);
    retassure(hdr.length <= MUXCONNECT_MAX_PACKET_SIZE, "message too large (%u bytes)", hdr.length);
    retassure(hdr.message == MESSAGE_PLIST, "unexpected message type %u", hdr.message);

    payload_size = hdr.length - sizeof(hdr);
    retassure(payload_size, "received empty plist packet");
    assure(payload = (char*)malloc(payload_size));
    readAll(fd, payload, payload_size);

    plist_from_memory(payload, payload_size, &p_ret, NULL);
    retassure(p_ret, "Failed to parse received plist");
    if (tag) *tag = hdr.tag;
    return p_ret;
}

#pragma mark parsing
std::string mux_message_type(const plist_t packet) noexcept{
    plist_t p_messageType = NULL;
    const char *str = NULL;
    uint64_t str_len = 0;

    if (!packet || plist_get_node_type(packet) != PLIST_DICT) return {};
    if (!(p_messageType = plist_dict_get_item(packet, "MessageType"))) return {};
    if (plist_get_node_type(p_messageType) != PLIST_STRING) return {};
    if (!(str = plist_get_string_ptr(p_messageType, &str_len))) return {};
    return std::string(str,str_len);
}

uint64_t mux_result_number(const plist_t packet){
    plist_t p_number = NULL;
    uint64_t number = 0;

    retassure(mux_message_type(packet) == "Result", "packet is not a Result");
    retassure(p_number = plist_dict_get_item(packet, "Number"), "Result without Number");
    retassure(plist_get_node_type(p_number) == PLIST_UINT, "Result Number is not an integer");
    plist_get_uint_val(p_number, &number);
    return number;
}

static uint32_t mux_device_id(const plist_t packet){
    plist_t p_intval = NULL;
    uint64_t deviceID = 0;

    retassure(p_intval = plist_dict_get_item(packet, "DeviceID"), "broadcast without DeviceID");
    retassure(plist_get_node_type(p_intval) == PLIST_UINT, "DeviceID is not an integer");
    plist_get_uint_val(p_intval, &deviceID);
    return (uint32_t)deviceID;
}

BroadcastEvent mux_parse_broadcast(const plist_t packet){
    BroadcastEvent ret{BroadcastEvent::EVENT_UNRECOGNIZED, 0, {}, {}};
    std::string messageType = mux_message_type(packet);

    if (messageType == "Attached") {
        plist_t p_props = NULL;
        plist_t p_serial = NULL;
        const char *str = NULL;
        uint64_t str_len = 0;

        ret.type = BroadcastEvent::EVENT_ATTACHED;
        ret.deviceID = mux_device_id(packet);
        retassure(p_props = plist_dict_get_item(packet, "Properties"), "Attached broadcast without Properties");
        retassure(p_serial = plist_dict_get_item(p_props, "SerialNumber"), "Attached broadcast without SerialNumber");
        retassure(str = plist_get_string_ptr(p_serial, &str_len), "Failed to get str ptr from SerialNumber");
        ret.serial = std::string(str,str_len);
    } else if (messageType == "Detached") {
        ret.type = BroadcastEvent::EVENT_DETACHED;
        ret.deviceID = mux_device_id(packet);
    } else {
        char *xml = NULL;
        cleanup([&]{
            safeFree(xml);
        });
        uint32_t xmlsize = 0;
        if (packet) plist_to_xml(packet, &xml, &xmlsize);
        if (xml) ret.raw = std::string(xml,xmlsize);
    }
    return ret;
}
