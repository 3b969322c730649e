//
//  USBMuxDetector.cpp
//  muxconnect
//

#include "USBMuxDetector.hpp"
#include "../Packet/MuxPacket.hpp"
#include <libgeneral/macros.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

static void set_recv_timeout(int fd, std::chrono::milliseconds timeout){
    struct timeval tv = {
        .tv_sec = (time_t)(timeout.count() / 1000),
        .tv_usec = (suseconds_t)((timeout.count() % 1000) * 1000)
    };
    assure(!setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)));
}

#pragma mark USBMuxDetector
USBMuxDetector::USBMuxDetector(const std::string &socketPath, std::chrono::milliseconds handshakeTimeout)
: _socketPath(socketPath), _handshakeTimeout(handshakeTimeout)
, _fd(-1), _cancelled(false), _loopThreadID{}
{
    //
}

USBMuxDetector::~USBMuxDetector(){
    debug("[USBMuxDetector] destroying detector");
    _cancelled = true;
    stopLoop();
    {
        int fd = _fd.exchange(-1);
        if (fd >= 0) close(fd);
    }
}

#pragma mark inheritance function
bool USBMuxDetector::loopEvent(){
    plist_t p_packet = NULL;
    cleanup([&]{
        safeFreeCustom(p_packet, plist_free);
    });
    BroadcastEvent event{};

    _loopThreadID = std::this_thread::get_id();
    try {
        p_packet = mux_recv_plist(_fd);
    } catch (tihmstar::exception &e) {
        if (!_cancelled) {
            deliver(NULL, &e);
        } else {
            debug("[USBMuxDetector] feed closed after cancel");
        }
        return false;
    }

    try {
        event = mux_parse_broadcast(p_packet);
    } catch (tihmstar::exception &e) {
        warning("Ignoring malformed broadcast with error=%d (%s)",e.code(),e.what());
        return true;
    }
    deliver(&event, NULL);
    return true;
}

void USBMuxDetector::stopAction() noexcept{
    int fd = _fd;
    if (fd >= 0) shutdown(fd, SHUT_RDWR);
}

void USBMuxDetector::deliver(const BroadcastEvent *event, const tihmstar::exception *err) noexcept{
    std::unique_lock<std::mutex> ul(_handlerLck);
    if (_cancelled) return;
    try {
        _handler(event, err);
    } catch (tihmstar::exception &e) {
        error("broadcast handler failed with error=%d (%s)",e.code(),e.what());
    } catch (std::exception &e) {
        error("broadcast handler failed (%s)",e.what());
    }
}

#pragma mark BroadcastDetector
bool USBMuxDetector::listen(handler_t handler){
    plist_t p_req = NULL;
    plist_t p_rsp = NULL;
    int fd = -1;
    cleanup([&]{
        safeFreeCustom(p_req, plist_free);
        safeFreeCustom(p_rsp, plist_free);
        safeClose(fd);
    });
    retassure(handler, "listen requires a handler");
    retassure(!_handler, "detector is already listening");

    try {
        uint64_t result = 0;
        fd = mux_socket_connect(_socketPath);
        set_recv_timeout(fd, _handshakeTimeout);
        assure(p_req = mux_listen_packet());
        mux_send_plist(fd, 1, p_req);
        p_rsp = mux_recv_plist(fd);
        result = mux_result_number(p_rsp);
        retassure(result == RESULT_OK, "usbmuxd refused Listen with result=%llu",(unsigned long long)result);
        set_recv_timeout(fd, std::chrono::milliseconds{0});
    } catch (tihmstar::exception &e) {
        error("Failed to listen to broadcast from %s with error=%d (%s)",_socketPath.c_str(),e.code(),e.what());
        return false;
    }

    _handler = handler;
    _cancelled = false;
    _fd = fd; fd = -1;
    info("Listening for devices on %s",_socketPath.c_str());
    startLoop();
    return true;
}

void USBMuxDetector::cancel() noexcept{
    if (!_cancelled.exchange(true)) {
        info("Cancelling broadcast listener on %s",_socketPath.c_str());
        int fd = _fd;
        if (fd >= 0) shutdown(fd, SHUT_RDWR);
    }
    if (std::this_thread::get_id() != _loopThreadID.load()) {
        //wait for a handler that is still running
        std::unique_lock<std::mutex> ul(_handlerLck);
    }
}
