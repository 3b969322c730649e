//
//  Channel.hpp
//  muxconnect
//

#ifndef Channel_hpp
#define Channel_hpp

#include <libgeneral/exception.hpp>
#include <plist/plist.h>

#include <functional>
#include <memory>

/*
 Abstract class
 One connection to the daemon. Operations complete asynchronously, in the order they were issued.
 */
class Channel{
public:
    using send_completion_t = std::function<void(const tihmstar::exception *err)>;
    //packet is not owned by the callee and only valid for the duration of the call
    using receive_completion_t = std::function<void(plist_t packet, const tihmstar::exception *err)>;

    virtual ~Channel() = default;

    //packet is not consumed
    virtual void sendPacket(plist_t packet, send_completion_t completion) = 0;
    virtual void receivePacket(receive_completion_t completion) = 0;

    /*
     Hands the underlying connection to the caller, who is responsible for closing it.
     The channel is unusable afterwards.
     Must not be called while an operation is still pending.
     */
    virtual int releaseFd() = 0;
};

//throws if the channel could not be opened
using ChannelFactory = std::function<std::unique_ptr<Channel>()>;

#endif /* Channel_hpp */
