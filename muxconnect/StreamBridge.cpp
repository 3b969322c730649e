//
//  StreamBridge.cpp
//  muxconnect
//

#include "StreamBridge.hpp"
#include <libgeneral/macros.h>

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>

static void writeAll(int fd, const char *buf, size_t buflen){
    while (buflen) {
        ssize_t didWrite = write(fd, buf, buflen);
        if (didWrite == -1 && errno == EINTR) continue;
        retassure(didWrite > 0, "write failed on fd=%d err=%s",fd,strerror(errno));
        buf += didWrite;
        buflen -= didWrite;
    }
}

StreamBridge::StreamBridge(int localIn, int localOut, int remote, bool ownsLocal)
: _localIn(localIn), _localOut(localOut), _remote(remote), _ownsLocal(ownsLocal), _killInProcess(false)
{
    debug("[StreamBridge] created in=%d out=%d remote=%d",_localIn,_localOut,_remote);
}

StreamBridge::~StreamBridge(){
    debug("Destroying StreamBridge (%p)",this);
    stopLoop();
    safeClose(_remote);
    if (_ownsLocal) {
        if (_localOut != _localIn) safeClose(_localOut);
        safeClose(_localIn);
    }
}

void StreamBridge::start(std::function<void()> onFinish){
    _onFinish = onFinish;
    startLoop();
}

void StreamBridge::kill() noexcept{
    //sets _killInProcess to true and executes if statement if it was false before
    if (!_killInProcess.exchange(true)) {
        std::thread delthread([this](){
            debug("killing StreamBridge (%p) remote=%d",this,_remote);
            delete this;
        });
        delthread.detach();
    }
}

#pragma mark inheritance function
bool StreamBridge::loopEvent(){
    int err = 0;
    ssize_t cnt = 0;
    char buf[0x4000];
    struct pollfd pfds[2] = {
        {
            .fd = _localIn,
            .events = POLLIN
        },
        {
            .fd = _remote,
            .events = POLLIN
        }
    };
    const int dst[2] = {_remote, _localOut};

    if ((err = poll(pfds,2,-1)) == -1){
        retassure(errno == EINTR, "poll failed errno=%d (%s)",errno,strerror(errno));
        return true;
    }

    for (int i = 0; i < 2; ++i){
        if (pfds[i].revents & POLLIN){
            retassure((cnt = read(pfds[i].fd, buf, sizeof(buf))) >= 0, "read failed on fd=%d err=%s",pfds[i].fd,strerror(errno));
            if (cnt == 0) {
                debug("[StreamBridge] fd=%d closed",pfds[i].fd);
                return false;
            }
            writeAll(dst[i], buf, cnt);
        } else if (pfds[i].revents & (POLLHUP | POLLERR | POLLNVAL)) {
            debug("[StreamBridge] fd=%d hung up revents=0x%02x",pfds[i].fd,pfds[i].revents);
            return false;
        }
    }
    return true;
}

void StreamBridge::afterLoop() noexcept{
    if (_onFinish) _onFinish();
}

void StreamBridge::stopAction() noexcept{
    if (_remote >= 0) shutdown(_remote, SHUT_RDWR);
}
