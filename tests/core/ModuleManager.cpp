#include <core/ModuleManager.hpp>
#include <helpers/fs/FsUtils.hpp>
#include "../shared/Mocks.hpp"
#include "../shared/TempDir.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <filesystem>

static const std::string MASTER = R"#(var config = {
  modules: [
    {
      module: "clock",
      position: "top_left"
    },
  ]
};
)#";

static const std::string PAGES_MASTER = R"#(var config = {
  modules: [
    {
      module: "clock",
      position: "top_left"
    },
    {
      module: "MMM-pages",
      config: {
        modules: [
          ["clock"], // PAGE1 - Time
          ["calendar"], // PAGE2 - Agenda
        ],
        fixed: []
      }
    },
  ]
};
)#";

class ModuleManagerTest : public ::testing::Test {
  protected:
    virtual std::string masterText() {
        return MASTER;
    }

    void SetUp() override {
        dir.write("mm/config/config.js", masterText());
        dir.write("my/head", "var config = {\n  modules: [\n");
        dir.write("my/tail", "  ]\n};\n");
        dir.write("my/templates/weather.js", "{\n  module: \"weather\"\n}");

        SSettings settings;
        settings.layout         = Settings::layoutFor(dir.path("mm"), dir.path("my"));
        settings.verify.enabled = false;

        manager = makeUnique<CModuleManager>(settings);

        auto verifier = makeUnique<CMockVerifier>();
        mockVerifier  = verifier.get();
        manager->setVerifier(std::move(verifier));
        manager->setModuleSource(makeUnique<CMockModuleSource>());

        manager->m_confirm = [this](const std::string& prompt) {
            prompts.emplace_back(prompt);
            if (answers.empty())
                return false;
            const bool ANSWER = answers.front();
            answers.pop_front();
            return ANSWER;
        };

        manager->m_readLine = [this]() -> std::optional<std::string> {
            if (lines.empty())
                return std::nullopt;
            auto line = lines.front();
            lines.pop_front();
            return line;
        };

        ASSERT_TRUE(manager->init().has_value());
    }

    std::string read(const std::string& rel) {
        return NFsUtils::readFileAsString(dir.path(rel)).value_or("<missing>");
    }

    CTempDir                 dir;
    UP<CModuleManager>       manager;
    CMockVerifier*           mockVerifier = nullptr;
    std::deque<bool>         answers;
    std::deque<std::string>  lines;
    std::vector<std::string> prompts;
};

class ModuleManagerPagesTest : public ModuleManagerTest {
  protected:
    virtual std::string masterText() {
        return PAGES_MASTER;
    }

    void SetUp() override {
        ModuleManagerTest::SetUp();

        dir.write("my/pages", "    {\n      module: \"MMM-pages\",\n      config: { modules: [[\"clock\"], [\"MODULE\"]] }\n    }\n");
        mockVerifier->m_watchFile = dir.path("mm/config/config.js");
        manager->populate({}, true);
    }
};

TEST_F(ModuleManagerTest, initSeedsMaster) {
    EXPECT_EQ(read("my/config.Master"), MASTER);
    EXPECT_EQ(manager->masterModules(), (std::vector<std::string>{"clock"}));
}

TEST_F(ModuleManagerTest, populateUsesMaster) {
    const auto RESULT = manager->populate({}, true);

    EXPECT_EQ(RESULT.count(POPULATE_FROM_MASTER), 1u);
    EXPECT_EQ(read("my/templates/clock.js"), "    {\n      module: \"clock\",\n      position: \"top_left\"\n    },");
}

TEST_F(ModuleManagerTest, populateReportsBundledModules) {
    dir.write("my/config.Master", "var config = {\n  modules: [\n    {\n      module: \"default/alert\"\n    },\n  ]\n};\n");

    testing::internal::CaptureStdout();
    const auto        RESULT = manager->populate();
    const std::string OUT    = testing::internal::GetCapturedStdout();

    EXPECT_EQ(RESULT.count(POPULATE_IGNORED_DEFAULT), 1u);
    EXPECT_NE(OUT.find("Skipping default/alert, bundled with MagicMirror"), std::string::npos);
    EXPECT_EQ(OUT.find("Template exists: default/alert"), std::string::npos);
}

TEST_F(ModuleManagerTest, menuWithNothingToPick) {
    dir.write("my/config.Master", "var config = {\n  modules: [\n  ]\n};\n");
    std::filesystem::remove(dir.path("my/templates/weather.js"));

    lines = {"1", "2", "5"};

    testing::internal::CaptureStdout();
    manager->menu();
    const std::string OUT = testing::internal::GetCapturedStdout();

    EXPECT_NE(OUT.find("No module templates found"), std::string::npos);
    EXPECT_NE(OUT.find("No modules found in master config"), std::string::npos);
    EXPECT_EQ(mockVerifier->m_calls, 0);
}

TEST_F(ModuleManagerTest, testAndAccept) {
    manager->populate({}, true);

    // full master, update master
    answers = {true, true};
    EXPECT_TRUE(manager->testModule("weather"));

    EXPECT_EQ(mockVerifier->m_calls, 2);
    EXPECT_EQ(manager->masterModules(), (std::vector<std::string>{"clock", "weather"}));
    EXPECT_EQ(read("my/config.Master"), read("mm/config/config.js"));
}

TEST_F(ModuleManagerTest, declineKeepsEverything) {
    manager->populate({}, true);

    answers = {true, false};
    EXPECT_FALSE(manager->testModule("weather"));

    EXPECT_EQ(read("my/config.Master"), MASTER);
    EXPECT_EQ(read("mm/config/config.js"), MASTER);
    // two test configs, then the restored one
    EXPECT_EQ(mockVerifier->m_calls, 3);

    answers = {false};
    EXPECT_FALSE(manager->testModule("weather"));
    EXPECT_EQ(prompts.back(), "Test with full master?");
    EXPECT_EQ(read("mm/config/config.js"), MASTER);
    EXPECT_EQ(mockVerifier->m_calls, 5);
}

TEST_F(ModuleManagerTest, declineReloadsRestoredConfig) {
    manager->populate({}, true);
    mockVerifier->m_watchFile = dir.path("mm/config/config.js");

    answers = {true, false};
    EXPECT_FALSE(manager->testModule("weather"));

    ASSERT_EQ(mockVerifier->m_seen.size(), 3u);
    EXPECT_NE(mockVerifier->m_seen[1].find("module: \"weather\""), std::string::npos);
    EXPECT_EQ(mockVerifier->m_seen[2], MASTER);
}

TEST_F(ModuleManagerTest, failedVerificationStopsTheTest) {
    manager->populate({}, true);
    mockVerifier->m_result = VERIFY_FAILED;

    answers = {true, true};
    EXPECT_FALSE(manager->testModule("weather"));

    // never got past the first step, the second verify is the reload
    EXPECT_TRUE(prompts.empty());
    EXPECT_EQ(mockVerifier->m_calls, 2);
    EXPECT_EQ(read("my/config.Master"), MASTER);
    EXPECT_EQ(read("mm/config/config.js"), MASTER);
}

TEST_F(ModuleManagerTest, unknownModule) {
    EXPECT_FALSE(manager->testModule("MMM-nothing"));
    EXPECT_EQ(mockVerifier->m_calls, 0);
    EXPECT_EQ(read("mm/config/config.js"), MASTER);
}

TEST_F(ModuleManagerTest, removeModule) {
    manager->populate({}, true);
    answers = {true, true};
    ASSERT_TRUE(manager->testModule("weather"));

    answers = {true, true};
    EXPECT_TRUE(manager->removeModule("clock"));
    EXPECT_EQ(manager->masterModules(), (std::vector<std::string>{"weather"}));

    EXPECT_FALSE(manager->removeModule("clock"));
}

TEST_F(ModuleManagerTest, restoreSnapshot) {
    manager->populate({}, true);
    answers = {true, true};
    ASSERT_TRUE(manager->testModule("weather"));

    answers = {true};
    EXPECT_TRUE(manager->restoreSnapshot());
    EXPECT_EQ(read("my/config.Master"), MASTER);
    EXPECT_EQ(read("mm/config/config.js"), MASTER);
    EXPECT_EQ(mockVerifier->m_calls, 3);
}

TEST_F(ModuleManagerPagesTest, pagesStep) {
    // with 2 pages, full master, skip page placement, update master
    answers = {true, true, true};
    lines   = {"s"};
    EXPECT_TRUE(manager->testModule("weather"));

    EXPECT_EQ(prompts[0], "Test with 2 pages?");
    ASSERT_EQ(mockVerifier->m_seen.size(), 3u);

    const auto& PAGED = mockVerifier->m_seen[1];
    EXPECT_NE(PAGED.find("module: \"clock\""), std::string::npos);
    EXPECT_NE(PAGED.find("module: \"weather\""), std::string::npos);
    EXPECT_NE(PAGED.find("modules: [[\"clock\"], [\"weather\"]]"), std::string::npos);
    EXPECT_EQ(PAGED.find("MODULE"), std::string::npos);
    EXPECT_EQ(PAGED.find("PAGE1"), std::string::npos);

    // skipped, so the pages template is what populate wrote
    EXPECT_NE(read("my/templates/MMM-pages.js").find("[\"clock\"], // PAGE1 - Time"), std::string::npos);
}

TEST_F(ModuleManagerPagesTest, addToExistingPage) {
    // no 2-page step, full master, update master
    answers = {false, true, true};
    lines   = {"1"};
    EXPECT_TRUE(manager->testModule("weather"));

    ASSERT_EQ(mockVerifier->m_seen.size(), 2u);
    EXPECT_NE(mockVerifier->m_seen[1].find("[\"clock\", \"weather\"], // PAGE1 - Time"), std::string::npos);

    EXPECT_EQ(manager->masterModules(), (std::vector<std::string>{"clock", "MMM-pages", "weather"}));
    EXPECT_NE(read("my/config.Master").find("[\"clock\", \"weather\"], // PAGE1 - Time"), std::string::npos);
    EXPECT_NE(read("my/templates/MMM-pages.js").find("[\"clock\", \"weather\"], // PAGE1 - Time"), std::string::npos);
}

TEST_F(ModuleManagerPagesTest, addToNewPage) {
    answers = {false, true, true};
    lines   = {"n", "Forecast"};
    EXPECT_TRUE(manager->testModule("weather"));

    const auto MASTERTEXT = read("my/config.Master");
    EXPECT_NE(MASTERTEXT.find("[\"calendar\"], // PAGE2 - Agenda\n          [\"weather\"], // PAGE3 - Forecast\n        ],"), std::string::npos);
    EXPECT_NE(read("my/templates/MMM-pages.js").find("// PAGE3 - Forecast"), std::string::npos);
}

TEST_F(ModuleManagerPagesTest, declinedPagePlacementIsNotKept) {
    answers = {false, true, false};
    lines   = {"1"};
    EXPECT_FALSE(manager->testModule("weather"));

    EXPECT_EQ(read("my/config.Master"), PAGES_MASTER);
    EXPECT_EQ(read("mm/config/config.js"), PAGES_MASTER);
    EXPECT_EQ(read("my/templates/MMM-pages.js").find("weather"), std::string::npos);
}

TEST_F(ModuleManagerPagesTest, removeDropsModuleFromPages) {
    answers = {false, true, true};
    lines   = {"1"};
    ASSERT_TRUE(manager->testModule("weather"));

    answers = {true, true};
    EXPECT_TRUE(manager->removeModule("weather"));

    EXPECT_EQ(manager->masterModules(), (std::vector<std::string>{"clock", "MMM-pages"}));
    EXPECT_EQ(read("my/config.Master").find("weather"), std::string::npos);
    EXPECT_NE(read("my/config.Master").find("[\"clock\"], // PAGE1 - Time"), std::string::npos);
    EXPECT_EQ(read("my/templates/MMM-pages.js").find("weather"), std::string::npos);
}
