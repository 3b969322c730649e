//
//  BroadcastDetector.hpp
//  muxconnect
//

#ifndef BroadcastDetector_hpp
#define BroadcastDetector_hpp

#include <libgeneral/exception.hpp>

#include <stdint.h>
#include <functional>
#include <string>

struct BroadcastEvent{
    enum event_type{
        EVENT_UNRECOGNIZED = 0,
        EVENT_ATTACHED,
        EVENT_DETACHED
    };
    event_type type;
    uint32_t deviceID;
    std::string serial; //only set for EVENT_ATTACHED
    std::string raw;    //only set for EVENT_UNRECOGNIZED
};

/*
 Abstract class
 Owns the subscription to the daemon's broadcast feed.
 */
class BroadcastDetector{
public:
    /*
     event is NULL when err is set.
     Both pointers are only valid for the duration of the call.
     */
    using handler_t = std::function<void(const BroadcastEvent *event, const tihmstar::exception *err)>;

    virtual ~BroadcastDetector() = default;

    /*
     Returns whether the subscription attempt succeeded.
     Events are delivered on a detector owned thread until cancel() is called.
     */
    virtual bool listen(handler_t handler) = 0;

    /*
     Stops event delivery. When called from a thread other than the delivery thread,
     returns only after a handler invocation that is in progress has finished.
     */
    virtual void cancel() noexcept = 0;
};

#endif /* BroadcastDetector_hpp */
