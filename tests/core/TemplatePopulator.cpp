#include <core/TemplatePopulator.hpp>
#include <core/FragmentStore.hpp>
#include "../shared/Mocks.hpp"
#include "../shared/TempDir.hpp"

#include <gtest/gtest.h>

static const std::string MASTER = R"#(var config = {
  modules: [
    {
      module: "clock",
      position: "top_left"
    },
  ]
};
)#";

static const std::string README = R"#(# MMM-weather

Add this to your config:

```js
    {
      module: "MMM-weather",
      config: {
        apiKey: ""
      }
    },
```
)#";

class TemplatePopulatorTest : public ::testing::Test {
  protected:
    CTempDir           dir;
    CFragmentStore     store{dir.path("templates")};
    CMockModuleSource  source;
    CTemplatePopulator populator{store, source};
};

TEST_F(TemplatePopulatorTest, sourcePriority) {
    source.m_readmes["clock"]       = "{\n  module: \"clock\",\n  from: \"readme\"\n}";
    source.m_readmes["MMM-weather"] = README;
    source.m_samples["MMM-weather"] = "sample";
    source.m_samples["MMM-sample"]  = "{ module: \"MMM-sample\" }\n";

    const auto RESULT = populator.populate({"clock", "MMM-weather", "MMM-sample", "MMM-nothing"}, MASTER);

    ASSERT_EQ(RESULT.entries.size(), 4u);
    EXPECT_EQ(RESULT.entries[0].outcome, POPULATE_FROM_MASTER);
    EXPECT_EQ(RESULT.entries[1].outcome, POPULATE_FROM_README);
    EXPECT_EQ(RESULT.entries[2].outcome, POPULATE_FROM_SAMPLE);
    EXPECT_EQ(RESULT.entries[3].outcome, POPULATE_SKIPPED);
    EXPECT_EQ(RESULT.created(), 3u);

    EXPECT_EQ(store.read("clock").value(), "    {\n      module: \"clock\",\n      position: \"top_left\"\n    },");
    EXPECT_EQ(store.read("MMM-weather").value(), "    {\n      module: \"MMM-weather\",\n      config: {\n        apiKey: \"\"\n      }\n    },");
    // samples are taken verbatim
    EXPECT_EQ(store.read("MMM-sample").value(), "{ module: \"MMM-sample\" }\n");
    EXPECT_FALSE(store.exists("MMM-nothing"));
}

TEST_F(TemplatePopulatorTest, idempotent) {
    source.m_samples["a"] = "A";
    source.m_samples["b"] = "B";

    const auto FIRST = populator.populate({"a", "b"}, MASTER);
    EXPECT_EQ(FIRST.created(), 2u);

    // a manual edit must survive
    dir.write("templates/a.js", "edited");

    const auto SECOND = populator.populate({"a", "b"}, MASTER);
    EXPECT_EQ(SECOND.created(), 0u);
    EXPECT_EQ(SECOND.count(POPULATE_EXISTS), 2u);
    EXPECT_EQ(store.read("a").value(), "edited");
    EXPECT_EQ(store.read("b").value(), "B");
}

TEST_F(TemplatePopulatorTest, refreshIsExplicit) {
    dir.write("templates/clock.js", "stale");

    auto result = populator.populate({"clock"}, MASTER);
    EXPECT_EQ(result.entries[0].outcome, POPULATE_EXISTS);
    EXPECT_EQ(store.read("clock").value(), "stale");

    result = populator.populate({"clock"}, MASTER, {"clock"});
    EXPECT_EQ(result.entries[0].outcome, POPULATE_FROM_MASTER);
    EXPECT_NE(store.read("clock")->find("top_left"), std::string::npos);
}

TEST_F(TemplatePopulatorTest, defaultsAndBadNames) {
    const auto RESULT = populator.populate({"default/clock", "../escape", ".hidden", "has space"}, MASTER);

    EXPECT_EQ(RESULT.entries[0].outcome, POPULATE_IGNORED_DEFAULT);
    EXPECT_EQ(RESULT.count(POPULATE_INVALID_NAME), 3u);
    EXPECT_TRUE(store.list().empty());
    EXPECT_EQ(source.m_readmeCalls, 0);
}

TEST_F(TemplatePopulatorTest, readmeWithoutBlock) {
    source.m_readmes["MMM-x"] = "# MMM-x\n\nno config example here\n";

    const auto ENTRY = populator.populateOne("MMM-x", MASTER);

    EXPECT_EQ(ENTRY.outcome, POPULATE_SKIPPED);
    EXPECT_EQ(source.m_readmeCalls, 1);
}

TEST(FragmentStore, validName) {
    EXPECT_TRUE(CFragmentStore::validName("MMM-pages"));
    EXPECT_TRUE(CFragmentStore::validName("clock"));
    EXPECT_TRUE(CFragmentStore::validName("MMM-Remote_Control.v2"));

    EXPECT_FALSE(CFragmentStore::validName(""));
    EXPECT_FALSE(CFragmentStore::validName(".git"));
    EXPECT_FALSE(CFragmentStore::validName("default/clock"));
    EXPECT_FALSE(CFragmentStore::validName("a\"b"));
}

TEST(FragmentStore, listIsSorted) {
    CTempDir dir;
    dir.write("b.js", "");
    dir.write("a.js", "");
    dir.write("notes.txt", "");

    CFragmentStore store{dir.path()};

    const auto     NAMES = store.list();
    ASSERT_EQ(NAMES.size(), 2u);
    EXPECT_EQ(NAMES[0], "a");
    EXPECT_EQ(NAMES[1], "b");
    EXPECT_EQ(store.pathFor("a"), dir.path("a.js"));
}
