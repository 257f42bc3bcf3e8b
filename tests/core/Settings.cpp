#include <core/Settings.hpp>

#include <gtest/gtest.h>

TEST(Settings, defaults) {
    const auto SETTINGS = Settings::fromToml("");

    ASSERT_TRUE(SETTINGS.has_value()) << SETTINGS.error();
    EXPECT_EQ(SETTINGS->assembly.indent, "      ");
    EXPECT_EQ(SETTINGS->assembly.placeholder, "MODULE");
    EXPECT_EQ(SETTINGS->assembly.pagesModule, "MMM-pages");
    EXPECT_EQ(SETTINGS->assembly.baselineModule, "clock");
    EXPECT_EQ(SETTINGS->verify.timeoutSecs, 30);
    EXPECT_TRUE(SETTINGS->verify.enabled);
    EXPECT_TRUE(SETTINGS->layout.master.ends_with("/my_config/config.Master"));
}

TEST(Settings, overrides) {
    const auto SETTINGS = Settings::fromToml(R"#(
[paths]
magicmirror_home = "/opt/mm"
my_config = "/etc/mycfg"

[assembly]
indent = "    "
baseline_module = "compliments"

[verify]
pm2 = "/usr/local/bin/pm2"
timeout_secs = 5
check_online = false
)#");

    ASSERT_TRUE(SETTINGS.has_value()) << SETTINGS.error();
    EXPECT_EQ(SETTINGS->assembly.indent, "    ");
    EXPECT_EQ(SETTINGS->assembly.baselineModule, "compliments");
    EXPECT_EQ(SETTINGS->assembly.placeholder, "MODULE");
    EXPECT_EQ(SETTINGS->verify.pm2, "/usr/local/bin/pm2");
    EXPECT_EQ(SETTINGS->verify.timeoutSecs, 5);
    EXPECT_FALSE(SETTINGS->verify.checkOnline);

    EXPECT_EQ(SETTINGS->layout.configJs, "/opt/mm/config/config.js");
    EXPECT_EQ(SETTINGS->layout.modulesDir, "/opt/mm/modules");
    EXPECT_EQ(SETTINGS->layout.templatesDir, "/etc/mycfg/templates");
    EXPECT_EQ(SETTINGS->layout.masterBak, "/etc/mycfg/config.Master.bak");
    EXPECT_EQ(SETTINGS->layout.configJsBak, "/etc/mycfg/config.js.bak");
}

TEST(Settings, rejectsBadInput) {
    EXPECT_FALSE(Settings::fromToml("[verify\ntimeout_secs = ").has_value());
    EXPECT_FALSE(Settings::fromToml("[verify]\ntimeout_secs = 0\n").has_value());
    EXPECT_FALSE(Settings::fromToml("[assembly]\nplaceholder = \"\"\n").has_value());

    const auto RET = Settings::fromToml("[verify\n", "broken.toml");
    ASSERT_FALSE(RET.has_value());
    EXPECT_NE(RET.error().find("broken.toml"), std::string::npos);
}

TEST(Settings, missingExplicitFile) {
    EXPECT_FALSE(Settings::load("/nonexistent/mmconf.toml").has_value());
}
