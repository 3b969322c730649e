//
//  USBMuxChannel.hpp
//  muxconnect
//

#ifndef USBMuxChannel_hpp
#define USBMuxChannel_hpp

#include "Channel.hpp"
#include <libgeneral/Manager.hpp>
#include <libgeneral/DeliveryEvent.hpp>

#include <atomic>
#include <string>

/*
 Channel to usbmuxd over its UNIX socket.
 Queued operations are executed one after another on the channel's own thread.
 */
class USBMuxChannel : public Channel, tihmstar::Manager{
    int _fd;
    uint32_t _tag;
    std::atomic_bool _released;
    tihmstar::DeliveryEvent<std::function<void()>> _ops;

#pragma mark inheritance function
    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;

public:
    USBMuxChannel(const std::string &socketPath);
    USBMuxChannel(const USBMuxChannel &) = delete;
    USBMuxChannel(USBMuxChannel &&o) = delete;
    virtual ~USBMuxChannel() override;

    static ChannelFactory factory(const std::string &socketPath);

#pragma mark Channel
    virtual void sendPacket(plist_t packet, send_completion_t completion) override;
    virtual void receivePacket(receive_completion_t completion) override;
    virtual int releaseFd() override;
};

#endif /* USBMuxChannel_hpp */
