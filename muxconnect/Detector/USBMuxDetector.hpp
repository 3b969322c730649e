//
//  USBMuxDetector.hpp
//  muxconnect
//

#ifndef USBMuxDetector_hpp
#define USBMuxDetector_hpp

#include "BroadcastDetector.hpp"
#include <libgeneral/Manager.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

class USBMuxDetector : public BroadcastDetector, tihmstar::Manager{
    std::string _socketPath;
    std::chrono::milliseconds _handshakeTimeout;
    std::atomic_int _fd;
    std::atomic_bool _cancelled;
    std::mutex _handlerLck; //held while the handler runs
    handler_t _handler;
    std::atomic<std::thread::id> _loopThreadID;

#pragma mark inheritance function
    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;

    void deliver(const BroadcastEvent *event, const tihmstar::exception *err) noexcept;

public:
    USBMuxDetector(const std::string &socketPath, std::chrono::milliseconds handshakeTimeout = std::chrono::milliseconds{5000});
    USBMuxDetector(const USBMuxDetector &) = delete;
    USBMuxDetector(USBMuxDetector &&o) = delete;
    virtual ~USBMuxDetector() override;

#pragma mark BroadcastDetector
    virtual bool listen(handler_t handler) override;
    virtual void cancel() noexcept override;
};

#endif /* USBMuxDetector_hpp */
