//
//  MUXConnectException.hpp
//  muxconnect
//

#ifndef MUXConnectException_hpp
#define MUXConnectException_hpp

#include <libgeneral/exception.hpp>

namespace tihmstar {

class MUXConnectException : public tihmstar::exception {
public:
    using tihmstar::exception::exception;
};

#pragma mark custom catch exceptions
class MUXConnectException_device_not_found : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_channel_construction_failed : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_send_failed : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_send_timedout : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_receive_failed : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_receive_timedout : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_connection_refused : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

class MUXConnectException_disconnected : public MUXConnectException{
    using MUXConnectException::MUXConnectException;
};

};

#endif /* MUXConnectException_hpp */
