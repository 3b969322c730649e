//
//  MuxPacket.hpp
//  muxconnect
//

#ifndef MuxPacket_hpp
#define MuxPacket_hpp

#include "../muxconnect-proto.h"
#include "../Detector/BroadcastDetector.hpp"

#include <plist/plist.h>
#include <string>

#pragma mark socket
//returns a connected socket to the daemon, caller owns it
int mux_socket_connect(const std::string &socketPath);

#pragma mark requests
plist_t mux_listen_packet();
plist_t mux_connect_packet(uint32_t deviceID, uint16_t port);

#pragma mark framing
void mux_send_plist(int fd, uint32_t tag, const plist_t packet);
/*
 Blocks until a full packet was read.
 Throws MUXConnectException_disconnected if the peer closed the connection.
 Caller owns the returned plist.
 */
plist_t mux_recv_plist(int fd, uint32_t *tag = nullptr);

#pragma mark parsing
std::string mux_message_type(const plist_t packet) noexcept;
uint64_t mux_result_number(const plist_t packet);
BroadcastEvent mux_parse_broadcast(const plist_t packet);

#endif /* MuxPacket_hpp */
