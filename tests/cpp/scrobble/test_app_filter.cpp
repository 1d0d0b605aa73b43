#include "scrobble/app_filter.h"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using scrobble::AppFilterAction;
using scrobble::AppFilterConfig;
using scrobble::SharedAppFilter;

TEST(AppFilterTest, UnknownAppFollowsScrobbleUnknown) {
    AppFilterConfig config;
    EXPECT_EQ(scrobble::classify(std::nullopt, config), AppFilterAction::Allow);
    EXPECT_EQ(scrobble::classify(std::string(), config), AppFilterAction::Allow);

    config.scrobbleUnknown = false;
    EXPECT_EQ(scrobble::classify(std::nullopt, config), AppFilterAction::Ignore);
}

TEST(AppFilterTest, ListsTakePrecedenceOverPrompt) {
    AppFilterConfig config;
    config.allowedApps = {"spotify"};
    config.ignoredApps = {"firefox"};

    EXPECT_EQ(scrobble::classify(std::string("spotify"), config), AppFilterAction::Allow);
    EXPECT_EQ(scrobble::classify(std::string("firefox"), config), AppFilterAction::Ignore);
    EXPECT_EQ(scrobble::classify(std::string("vlc"), config), AppFilterAction::AskUser);

    config.promptForNewApps = false;
    EXPECT_EQ(scrobble::classify(std::string("vlc"), config), AppFilterAction::Allow);
}

TEST(AppFilterTest, ValidateRejectsOverlap) {
    AppFilterConfig config;
    config.allowedApps = {"a", "b"};
    config.ignoredApps = {"c", "b"};

    std::string error;
    EXPECT_FALSE(scrobble::validateAppFilterConfig(config, error));
    EXPECT_EQ(error, "App 'b' cannot be in both allowedApps and ignoredApps");

    config.ignoredApps = {"c"};
    EXPECT_TRUE(scrobble::validateAppFilterConfig(config, error));
}

TEST(AppFilterTest, ActionNames) {
    EXPECT_STREQ(scrobble::appFilterActionToString(AppFilterAction::Allow), "allow");
    EXPECT_STREQ(scrobble::appFilterActionToString(AppFilterAction::Ignore), "ignore");
    EXPECT_STREQ(scrobble::appFilterActionToString(AppFilterAction::AskUser), "ask_user");
}

TEST(SharedAppFilterTest, RecordDecisionMovesBetweenLists) {
    SharedAppFilter filter;
    EXPECT_EQ(filter.classify(std::string("vlc")), AppFilterAction::AskUser);

    EXPECT_TRUE(filter.recordDecision("vlc", AppFilterAction::Ignore));
    EXPECT_EQ(filter.classify(std::string("vlc")), AppFilterAction::Ignore);

    EXPECT_TRUE(filter.recordDecision("vlc", AppFilterAction::Allow));
    EXPECT_EQ(filter.classify(std::string("vlc")), AppFilterAction::Allow);

    auto snapshot = filter.snapshot();
    EXPECT_EQ(snapshot.allowedApps, std::vector<std::string>{"vlc"});
    EXPECT_TRUE(snapshot.ignoredApps.empty());

    std::string error;
    EXPECT_TRUE(scrobble::validateAppFilterConfig(snapshot, error));
}

TEST(SharedAppFilterTest, RecordDecisionDoesNotDuplicate) {
    SharedAppFilter filter;
    filter.recordDecision("mpv", AppFilterAction::Allow);
    filter.recordDecision("mpv", AppFilterAction::Allow);
    EXPECT_EQ(filter.snapshot().allowedApps.size(), 1u);
}

TEST(SharedAppFilterTest, RejectsInvalidDecisions) {
    SharedAppFilter filter;
    EXPECT_FALSE(filter.recordDecision("", AppFilterAction::Allow));
    EXPECT_FALSE(filter.recordDecision("vlc", AppFilterAction::AskUser));
    EXPECT_TRUE(filter.snapshot().allowedApps.empty());
}

TEST(SharedAppFilterTest, ReplaceSwapsWholeConfig) {
    SharedAppFilter filter;
    AppFilterConfig config;
    config.promptForNewApps = false;
    config.ignoredApps = {"chromium"};
    filter.replace(config);

    EXPECT_EQ(filter.classify(std::string("chromium")), AppFilterAction::Ignore);
    EXPECT_EQ(filter.classify(std::string("vlc")), AppFilterAction::Allow);
}

TEST(SharedAppFilterTest, ConcurrentDecisionsAndReads) {
    SharedAppFilter filter;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&filter, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string app = "app" + std::to_string(i % 10);
                if (t % 2 == 0) {
                    filter.recordDecision(app, i % 3 == 0 ? AppFilterAction::Ignore
                                                          : AppFilterAction::Allow);
                } else {
                    filter.classify(app);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::string error;
    auto snapshot = filter.snapshot();
    EXPECT_TRUE(scrobble::validateAppFilterConfig(snapshot, error)) << error;
    EXPECT_EQ(snapshot.allowedApps.size() + snapshot.ignoredApps.size(), 10u);
}
