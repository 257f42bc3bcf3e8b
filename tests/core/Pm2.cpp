#include <core/Pm2.hpp>

#include <gtest/gtest.h>

TEST(Pm2, pickByExecPath) {
    const std::string JLIST =
        R"#([{"name":"api","pm_id":0,"pm2_env":{"pm_exec_path":"/srv/api/index.js","status":"online"}},{"name":"mirror","pm_id":1,"pm2_env":{"pm_exec_path":"/home/pi/MagicMirror/installers/mm.sh","status":"online"}}])#";

    EXPECT_EQ(NPm2::pickProcess(JLIST).value_or(""), "mirror");
}

TEST(Pm2, pickByName) {
    const std::string JLIST = R"#([{"name":"api","pm2_env":{"pm_exec_path":"/srv/api/index.js"}},{"name":"MM","pm2_env":{"pm_exec_path":"/opt/start.sh"}}])#";

    EXPECT_EQ(NPm2::pickProcess(JLIST).value_or(""), "MM");
}

TEST(Pm2, nothingToPick) {
    EXPECT_FALSE(NPm2::pickProcess("[]").has_value());
    EXPECT_FALSE(NPm2::pickProcess(R"#([{"name":"api","pm2_env":{"pm_exec_path":"/srv/api/index.js"}}])#").has_value());
    EXPECT_FALSE(NPm2::pickProcess("not json").has_value());
    EXPECT_FALSE(NPm2::pickProcess(R"#({"name":"MagicMirror"})#").has_value());
}

TEST(Pm2, chatterBeforeJson) {
    const std::string JLIST = "[PM2] Spawning PM2 daemon\n[PM2] PM2 Successfully daemonized\n[{\"name\":\"MagicMirror\",\"pm2_env\":{\"status\":\"stopped\"}}]\n";

    EXPECT_EQ(NPm2::pickProcess(JLIST).value_or(""), "MagicMirror");
    EXPECT_EQ(NPm2::processStatus(JLIST, "MagicMirror").value_or(""), "stopped");
}

TEST(Pm2, processStatus) {
    const std::string JLIST = R"#([{"name":"a","pm2_env":{"status":"online"}},{"name":"MagicMirror","pm2_env":{"status":"errored"}}])#";

    EXPECT_EQ(NPm2::processStatus(JLIST, "MagicMirror").value_or(""), "errored");
    EXPECT_EQ(NPm2::processStatus(JLIST, "a").value_or(""), "online");
    EXPECT_FALSE(NPm2::processStatus(JLIST, "b").has_value());
}

TEST(Pm2, resultNames) {
    EXPECT_STREQ(verifyResultToString(VERIFY_OK), "ok");
    EXPECT_STREQ(verifyResultToString(VERIFY_TIMEOUT), "timed out");
}
