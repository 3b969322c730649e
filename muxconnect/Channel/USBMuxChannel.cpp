//
//  USBMuxChannel.cpp
//  muxconnect
//

#include "USBMuxChannel.hpp"
#include "../Packet/MuxPacket.hpp"
#include <libgeneral/macros.h>

#include <sys/socket.h>
#include <unistd.h>

#pragma mark USBMuxChannel
USBMuxChannel::USBMuxChannel(const std::string &socketPath)
: _fd(-1), _tag(0), _released(false)
{
    _fd = mux_socket_connect(socketPath);
    debug("[USBMuxChannel] opened channel fd %d to %s",_fd,socketPath.c_str());
    startLoop();
}

USBMuxChannel::~USBMuxChannel(){
    debug("[USBMuxChannel] destroying channel fd %d",_fd);
    stopLoop();
    safeClose(_fd);
}

ChannelFactory USBMuxChannel::factory(const std::string &socketPath){
    return [socketPath]() -> std::unique_ptr<Channel>{
        return std::make_unique<USBMuxChannel>(socketPath);
    };
}

#pragma mark inheritance function
bool USBMuxChannel::loopEvent(){
    std::function<void()> op;
    try {
        op = _ops.wait();
    } catch (tihmstar::exception &e) {
        debug("[USBMuxChannel] operation queue closed, stopping worker");
        return false;
    }
    op();
    return true;
}

void USBMuxChannel::stopAction() noexcept{
    _ops.kill();
    //unblock a pending recv, unless the socket is being handed out
    if (!_released && _fd >= 0) shutdown(_fd, SHUT_RDWR);
}

#pragma mark Channel
void USBMuxChannel::sendPacket(plist_t packet, send_completion_t completion){
    retassure(!_released, "channel was already released");
    std::shared_ptr<void> p_copy(plist_copy(packet), plist_free);
    retassure(p_copy, "Failed to copy packet");
    uint32_t tag = ++_tag;

    _ops.post([this, p_copy, tag, completion]{
        try {
            mux_send_plist(_fd, tag, p_copy.get());
        } catch (tihmstar::exception &e) {
            completion(&e);
            return;
        }
        completion(NULL);
    });
}

void USBMuxChannel::receivePacket(receive_completion_t completion){
    retassure(!_released, "channel was already released");

    _ops.post([this, completion]{
        plist_t p_packet = NULL;
        cleanup([&]{
            safeFreeCustom(p_packet, plist_free);
        });
        try {
            p_packet = mux_recv_plist(_fd);
        } catch (tihmstar::exception &e) {
            completion(NULL, &e);
            return;
        }
        completion(p_packet, NULL);
    });
}

int USBMuxChannel::releaseFd(){
    retassure(!_released.exchange(true), "channel was already released");
    stopLoop();
    {
        int fd = _fd; _fd = -1;
        debug("[USBMuxChannel] released fd %d",fd);
        return fd;
    }
}
