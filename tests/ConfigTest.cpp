#include <gtest/gtest.h>
#include "sysconf/sysconf.hpp"
#include <libgeneral/macros.h>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <string>

using namespace std::chrono;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/muxconnect-config-XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir_ = tmpl;
        path_ = dir_ + "/muxconnect.plist";
        unsetenv(MUXCONNECT_SOCKET_ENV);
    }

    void TearDown() override {
        unsetenv(MUXCONNECT_SOCKET_ENV);
        unlink(path_.c_str());
        rmdir(dir_.c_str());
    }

    void writeConfig(plist_t p_config) {
        char *xml = NULL;
        uint32_t xmlsize = 0;
        cleanup([&]{
            safeFree(xml);
            safeFreeCustom(p_config, plist_free);
        });
        plist_to_xml(p_config, &xml, &xmlsize);
        writeRaw(std::string(xml, xmlsize));
    }

    void writeRaw(const std::string &contents) {
        int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(write(fd, contents.data(), contents.size()), (ssize_t)contents.size());
        close(fd);
    }

    std::string dir_;
    std::string path_;
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.socketPath, MUXCONNECT_DEFAULT_SOCKET_PATH);
    EXPECT_EQ(config.connectTimeout, kDeviceConnectTimeout);
    EXPECT_EQ(config.discoveryGracePeriod, kDeviceDetectTime);
    EXPECT_FALSE(config.useSyslog);

    ConnectorConfig cc = config.connectorConfig();
    EXPECT_EQ(cc.connectTimeout, milliseconds{5000});
    EXPECT_EQ(cc.discoveryGracePeriod, milliseconds{2000});
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    Config config;
    config.load(path_);
    EXPECT_EQ(config.socketPath, MUXCONNECT_DEFAULT_SOCKET_PATH);
    EXPECT_EQ(config.connectTimeout, kDeviceConnectTimeout);
}

TEST_F(ConfigTest, GarbageFileKeepsDefaults) {
    writeRaw("this is not a plist");
    Config config;
    config.load(path_);
    EXPECT_EQ(config.socketPath, MUXCONNECT_DEFAULT_SOCKET_PATH);
}

TEST_F(ConfigTest, FileOverridesValues) {
    plist_t p_config = plist_new_dict();
    plist_dict_set_item(p_config, "SocketPath", plist_new_string("/tmp/other-usbmuxd"));
    plist_dict_set_item(p_config, "ConnectTimeout", plist_new_uint(750));
    plist_dict_set_item(p_config, "DiscoveryGracePeriod", plist_new_uint(300));
    writeConfig(p_config);

    Config config;
    config.load(path_);
    EXPECT_EQ(config.socketPath, "/tmp/other-usbmuxd");
    EXPECT_EQ(config.connectTimeout, milliseconds{750});
    EXPECT_EQ(config.discoveryGracePeriod, milliseconds{300});
}

TEST_F(ConfigTest, WrongTypesAreIgnored) {
    plist_t p_config = plist_new_dict();
    plist_dict_set_item(p_config, "SocketPath", plist_new_uint(1));
    plist_dict_set_item(p_config, "ConnectTimeout", plist_new_string("fast"));
    plist_dict_set_item(p_config, "DiscoveryGracePeriod", plist_new_uint(10));
    writeConfig(p_config);

    Config config;
    config.load(path_);
    EXPECT_EQ(config.socketPath, MUXCONNECT_DEFAULT_SOCKET_PATH);
    EXPECT_EQ(config.connectTimeout, kDeviceConnectTimeout);
    EXPECT_EQ(config.discoveryGracePeriod, milliseconds{10});
}

TEST_F(ConfigTest, EnvironmentOverridesSocketPath) {
    plist_t p_config = plist_new_dict();
    plist_dict_set_item(p_config, "SocketPath", plist_new_string("/tmp/from-file"));
    writeConfig(p_config);

    setenv(MUXCONNECT_SOCKET_ENV, "UNIX:/tmp/from-env", 1);
    Config config;
    config.load(path_);
    EXPECT_EQ(config.socketPath, "/tmp/from-env");
}

TEST_F(ConfigTest, EnvironmentAcceptsPlainPath) {
    setenv(MUXCONNECT_SOCKET_ENV, "/tmp/plain", 1);
    Config config;
    config.load(path_);
    EXPECT_EQ(config.socketPath, "/tmp/plain");
}

TEST_F(ConfigTest, EnvironmentRejectsNonUnixAddress) {
    setenv(MUXCONNECT_SOCKET_ENV, "127.0.0.1:27015", 1);
    Config config;
    EXPECT_THROW(config.applyEnvironment(), tihmstar::exception);
}
