//
//  StreamBridge.hpp
//  muxconnect
//

#ifndef StreamBridge_hpp
#define StreamBridge_hpp

#include <libgeneral/Manager.hpp>
#include <atomic>
#include <functional>

/*
 Copies data between a local fd pair and a device stream until either side closes.
 _remote is always owned, the local fds only if ownsLocal is set.
 */
class StreamBridge : tihmstar::Manager{
    int _localIn;
    int _localOut; //may be the same fd as _localIn
    int _remote;
    bool _ownsLocal;
    std::atomic_bool _killInProcess;
    std::function<void()> _onFinish;

#pragma mark inheritance function
    virtual bool loopEvent() override;
    virtual void afterLoop() noexcept override;
    virtual void stopAction() noexcept override;

public:
    StreamBridge(int localIn, int localOut, int remote, bool ownsLocal);
    StreamBridge(const StreamBridge &) = delete;
    StreamBridge(StreamBridge &&o) = delete;
    virtual ~StreamBridge() override;

    //onFinish runs on the relay thread after the relay stopped
    void start(std::function<void()> onFinish = nullptr);

    //for heap allocated bridges, deletes this from a separate thread
    void kill() noexcept;
};

#endif /* StreamBridge_hpp */
