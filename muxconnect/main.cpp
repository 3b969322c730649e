//
//  main.cpp
//  muxconnect
//

#include "Connector/DeviceConnector.hpp"
#include "Channel/USBMuxChannel.hpp"
#include "Detector/USBMuxDetector.hpp"
#include "StreamBridge.hpp"
#include "sysconf/sysconf.hpp"

#include <libgeneral/macros.h>
#include <libgeneral/Event.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <getopt.h>
#include <string.h>
#include <errno.h>
#include <poll.h>
#include <stdio.h>

#ifndef PACKAGE_NAME
#   define PACKAGE_NAME "muxconnect"
#endif
#ifndef VERSION_STRING
#   define VERSION_STRING PACKAGE_NAME
#endif

enum run_mode{
    MODE_NONE = 0,
    MODE_LIST,
    MODE_WATCH,
    MODE_CONNECT,
    MODE_FORWARD
};

static tihmstar::Event terminateEvent;
static Config *gConfig = nullptr;
static int wakePipe[2] = {-1, -1};

static int verbose = LL_WARNING;

static run_mode mode = MODE_NONE;
static std::string configPath = MUXCONNECT_DEFAULT_CONFIG_PATH;
static std::string socketPathOverride;
static long timeoutOverride = -1;
static std::string udid;
static uint16_t devicePort = 0;
static uint16_t localPort = 0;


static void handle_signal(int sig) noexcept{
    static int ctrlcCounter = 0;
    info("Caught signal %d, exiting", sig);
    if (ctrlcCounter++ == 5){
        fatal("forcefully terminating program!");
        exit(2);
    }
    if (wakePipe[1] != -1) {
        char c = 0;
        if (write(wakePipe[1], &c, 1) != 1) {
            //accept loop will notice the terminate event on its next wakeup
        }
    }
    terminateEvent.notifyAll();
}

static void set_signal_handlers(void){
    assure(signal(SIGINT, handle_signal)  != SIG_ERR);
    assure(signal(SIGQUIT, handle_signal) != SIG_ERR);
    assure(signal(SIGTERM, handle_signal) != SIG_ERR);

    assure(signal(SIGPIPE, SIG_IGN) != SIG_ERR);
}

static void usage(){
    printf("Usage: %s [OPTIONS]\n", PACKAGE_NAME);
    printf("List devices known to usbmuxd and open connections to them.\n\n");
    printf("  -h, --help\t\t\tPrint this message.\n");
    printf("  -l, --list\t\t\tPrint the serials of all attached devices.\n");
    printf("  -w, --watch\t\t\tPrint device attach and detach events until interrupted.\n");
    printf("  -u, --udid SERIAL\t\tDevice to connect to.\n");
    printf("  -p, --port PORT\t\tDevice port to connect to, relays stdin/stdout.\n");
    printf("  -L, --local-port LPORT\tAccept connections on 127.0.0.1:LPORT and relay\n");
    printf("                        \teach one to PORT on the device.\n");
    printf("  -s, --socket PATH\t\tusbmuxd socket path (default %s).\n", MUXCONNECT_DEFAULT_SOCKET_PATH);
    printf("  -c, --config FILE\t\tConfig plist (default %s).\n", MUXCONNECT_DEFAULT_CONFIG_PATH);
    printf("  -t, --timeout MS\t\tConnect timeout in milliseconds.\n");
    printf("  -v, --verbose\t\t\tBe verbose (use twice or more to increase).\n");
    printf("  -V, --version\t\t\tPrint version information and exit.\n");
    printf("      --syslog\t\t\tLog to syslog instead of stderr\n");
    printf("      --debug\t\t\tEnable debug logging\n");
    printf("\n");
}

static uint16_t parse_port(const char *str){
    char *end = NULL;
    long val = strtol(str, &end, 0);
    if (!*str || *end || val <= 0 || val > 0xffff) {
        fatal("ERROR: invalid port '%s'", str);
        usage();
        exit(2);
    }
    return (uint16_t)val;
}

static void parse_opts(int argc, const char **argv){
    static struct option longopts[] = {
        {"help",                    no_argument,        NULL, 'h'},
        {"list",                    no_argument,        NULL, 'l'},
        {"watch",                   no_argument,        NULL, 'w'},
        {"udid",                    required_argument,  NULL, 'u'},
        {"port",                    required_argument,  NULL, 'p'},
        {"local-port",              required_argument,  NULL, 'L'},
        {"socket",                  required_argument,  NULL, 's'},
        {"config",                  required_argument,  NULL, 'c'},
        {"timeout",                 required_argument,  NULL, 't'},
        {"verbose",                 no_argument,        NULL, 'v'},
        {"version",                 no_argument,        NULL, 'V'},

        {"syslog",                  no_argument,        NULL,  0 },
        {"debug",                   no_argument,        NULL,  0 },
        {NULL,                      0,                  NULL,  0 }
    };
    int optindex = 0;
    int opt = 0;

    while ((opt = getopt_long(argc, (char* const *)argv, "hlwu:p:L:s:c:t:vV", longopts, &optindex)) >= 0) {
        switch (opt) {
            case 0: //long opts
            {
                std::string curopt = longopts[optindex].name;

                if (curopt == "syslog") {
                    gConfig->useSyslog = true;
                }else if (curopt == "debug") {
                    gConfig->debugLevel++;
                }
            }
                break;
            case 'h':
                usage();
                exit(0);
                break;
            case 'l':
                mode = MODE_LIST;
                break;
            case 'w':
                mode = MODE_WATCH;
                break;
            case 'u':
                udid = optarg;
                break;
            case 'p':
                devicePort = parse_port(optarg);
                break;
            case 'L':
                localPort = parse_port(optarg);
                break;
            case 's':
                socketPathOverride = optarg;
                break;
            case 'c':
                configPath = optarg;
                break;
            case 't':
                timeoutOverride = atol(optarg);
                if (timeoutOverride <= 0) {
                    fatal("ERROR: --timeout requires a positive number of milliseconds");
                    exit(2);
                }
                break;
            case 'v':
                ++verbose;
                break;
            case 'V':
                printf("%s\n", VERSION_STRING);
                exit(0);
            default:
                usage();
                exit(2);
        }
    }

    if (mode == MODE_NONE && udid.size()) {
        mode = localPort ? MODE_FORWARD : MODE_CONNECT;
    }
    if ((mode == MODE_CONNECT || mode == MODE_FORWARD) && (!udid.size() || !devicePort)) {
        fatal("ERROR: connecting requires --udid and --port");
        usage();
        exit(2);
    }
    if (mode == MODE_NONE) {
        usage();
        exit(2);
    }
}

#pragma mark modes
static int run_list(DeviceConnector &connector){
    for (auto &serial : connector.connectedDevices()) {
        printf("%s\n", serial.c_str());
    }
    return 0;
}

static int run_watch(DeviceConnector &connector){
    uint64_t wevent = terminateEvent.getNextEvent();
    uint64_t token = connector.observers().addObserver([](const DeviceNotification &note){
        if (note.type == DeviceNotification::DEVICE_ATTACHED) {
            printf("attached %s id=%u\n", note.serial.c_str(), note.deviceID);
        } else {
            printf("detached id=%u\n", note.deviceID);
        }
        fflush(stdout);
    });
    cleanup([&]{
        connector.observers().removeObserver(token);
    });
    connector.connectedDevices();
    terminateEvent.waitForEvent(wevent);
    return 0;
}

static int run_connect(DeviceConnector &connector){
    uint64_t wevent = terminateEvent.getNextEvent();
    ConnectResult res = connector.connectToDevice(udid, devicePort);
    if (res.fd == -1) {
        fatal("Failed to connect to %s:%u: %s (%s)", udid.c_str(), devicePort, connect_error_str(res.err), res.message.c_str());
        return 1;
    }
    StreamBridge bridge(STDIN_FILENO, STDOUT_FILENO, res.fd, false);
    bridge.start([]{
        terminateEvent.notifyAll();
    });
    terminateEvent.waitForEvent(wevent);
    return 0;
}

static int accept_client(int listenfd){
    struct sockaddr_in addr = {};
    socklen_t len = sizeof(addr);
    int cfd = -1;
    struct pollfd pfd[2] = {
        {
            .fd = listenfd,
            .events = POLLIN
        },
        {
            .fd = wakePipe[0],
            .events = POLLIN
        }
    };
    if (poll(pfd,2,-1) == -1){
        retassure(errno == EINTR, "poll failed errno=%d (%s)",errno,strerror(errno));
        return -1;
    }
    if (pfd[1].revents) return -2;
    retassure(pfd[0].revents & POLLIN, "poll returned, but there is no POLLIN event on listener");
    retassure((cfd = accept(listenfd, (struct sockaddr *)&addr, &len))>=0, "accept() failed (%s)", strerror(errno));
    return cfd;
}

static int run_forward(DeviceConnector &connector){
    int listenfd = -1;
    cleanup([&]{
        safeClose(listenfd);
        safeClose(wakePipe[0]);
        safeClose(wakePipe[1]);
    });
    struct sockaddr_in bind_addr = {};
    constexpr int yes = 1;

    assure(!pipe(wakePipe));
    retassure((listenfd = socket(AF_INET, SOCK_STREAM, 0))>=0, "socket() failed: %s", strerror(errno));
    setsockopt(listenfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind_addr.sin_port = htons(localPort);
    retassure(!bind(listenfd, (struct sockaddr*)&bind_addr, sizeof(bind_addr)), "bind() failed: %s", strerror(errno));
    retassure(!listen(listenfd, 5), "listen() failed: %s", strerror(errno));

    notice("Forwarding 127.0.0.1:%u to %s:%u", localPort, udid.c_str(), devicePort);
    while (true) {
        int cfd = -1;
        cfd = accept_client(listenfd);
        if (cfd == -2) break;
        if (cfd == -1) continue;

        ConnectResult res = connector.connectToDevice(udid, devicePort);
        if (res.fd == -1) {
            error("Dropping client fd %d: %s (%s)", cfd, connect_error_str(res.err), res.message.c_str());
            close(cfd);
            continue;
        }
        StreamBridge *bridge = new StreamBridge(cfd, cfd, res.fd, true);
        try {
            bridge->start([bridge]{
                bridge->kill();
            });
        } catch (tihmstar::exception &e) {
            error("failed to start relay with error=%d (%s)",e.code(),e.what());
            delete bridge;
        }
    }
    return 0;
}

int main(int argc, const char * argv[]) {
    int err = 0;
    std::shared_ptr<USBMuxDetector> detector;
    DeviceConnector *connector = nullptr;

    log_level = verbose;
    gConfig = new Config();

    parse_opts(argc,argv);

    try{
        gConfig->load(configPath);
    }catch(tihmstar::exception &e){
        fatal("Could not load config with error=%d (%s)",e.code(),e.what());
        creterror("failed to load config!");
    }
    if (socketPathOverride.size()) gConfig->socketPath = socketPathOverride;
    if (timeoutOverride > 0) gConfig->connectTimeout = std::chrono::milliseconds{timeoutOverride};

    if (gConfig->debugLevel) {
        verbose = LL_DEBUG;
    }
    if (gConfig->useSyslog) {
        log_enable_syslog();
    }
    log_level = verbose;
    info("starting %s", VERSION_STRING);

    set_signal_handlers();

    try {
        detector = std::make_shared<USBMuxDetector>(gConfig->socketPath, gConfig->connectTimeout);
        connector = new DeviceConnector(detector, USBMuxChannel::factory(gConfig->socketPath), gConfig->connectorConfig());
    } catch (tihmstar::exception &e) {
        creterror("failed to create connector with error=%d (%s)",e.code(),e.what());
    }

    try {
        switch (mode) {
            case MODE_LIST:
                err = run_list(*connector);
                break;
            case MODE_WATCH:
                err = run_watch(*connector);
                break;
            case MODE_CONNECT:
                err = run_connect(*connector);
                break;
            case MODE_FORWARD:
                err = run_forward(*connector);
                break;
            default:
                creterror("no mode selected");
        }
    } catch (tihmstar::exception &e) {
        fatal("failed with error=%d (%s)",e.code(),e.what());
        err = 1;
    }

error:
    debug("main reached cleanup");
    if (connector){
        delete connector;
    }
    detector = nullptr;
    if (gConfig){
        Config *cfg = gConfig; gConfig = nullptr;
        delete cfg;
    }
    log_disable_syslog();
    return err;
}
