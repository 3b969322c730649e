//
//  log.cpp
//  muxconnect
//

#include "log.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <syslog.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <atomic>
#include <mutex>

unsigned int log_level = LL_WARNING;

//muxconnect_log takes no lock, signal handlers log through it
static std::atomic_bool gUseSyslog{false};
static std::mutex gSyslogLck;

static const char *const gLevelNames[] = {
    "FATAL",
    "ERROR",
    "WARN",
    "INFO",
    "NOTICE",
    "DEBUG"
};

static long local_utc_offset(void){
    time_t now = time(NULL);
    struct tm tp = {};
    if (!localtime_r(&now, &tp)) return 0;
    return tp.tm_gmtoff;
}

//localtime_r locks the timezone state, so the offset is looked up once
static const long gUTCOffset = local_utc_offset();

static int level_to_syslog_level(int level){
    int result = level + LOG_CRIT;
    if (result > LOG_DEBUG) {
        result = LOG_DEBUG;
    }
    return result;
}

void log_enable_syslog(void){
    std::unique_lock<std::mutex> ul(gSyslogLck);
    if (!gUseSyslog) {
        openlog("muxconnect", LOG_PID, 0);
        gUseSyslog = true;
    }
}

void log_disable_syslog(void){
    std::unique_lock<std::mutex> ul(gSyslogLck);
    if (gUseSyslog) {
        gUseSyslog = false;
        closelog();
    }
}

void muxconnect_log(enum loglevel level, const char *fmt, ...){
    va_list ap;
    char buf[0x800] = {};
    struct timeval ts = {};
    int len = 0;
    int cnt = 0;

    if (level > log_level)
        return;

    va_start(ap, fmt);
    if (gUseSyslog) {
        vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        syslog(level_to_syslog_level(level), "[%s] %s", gLevelNames[level], buf);
        return;
    }

    gettimeofday(&ts, NULL);
    long secs = (long)((ts.tv_sec + gUTCOffset) % 86400);
    if (secs < 0) secs += 86400;

    len = snprintf(buf, sizeof(buf), "[%02ld:%02ld:%02ld.%03d][%s] ",
                   secs / 3600, (secs / 60) % 60, secs % 60, (int)(ts.tv_usec / 1000), gLevelNames[level]);
    if (len < 0) len = 0;
    cnt = vsnprintf(buf + len, sizeof(buf) - len, fmt, ap);
    va_end(ap);
    if (cnt > 0) len += cnt;
    if (len > (int)sizeof(buf) - 2) len = (int)sizeof(buf) - 2;
    buf[len++] = '\n';

    //single write keeps lines from concurrent threads whole
    for (int done = 0; done < len;) {
        ssize_t didWrite = write(STDERR_FILENO, buf + done, len - done);
        if (didWrite <= 0) break;
        done += (int)didWrite;
    }
}
