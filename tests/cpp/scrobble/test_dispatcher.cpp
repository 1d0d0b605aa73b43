#include "scrobble/dispatcher.h"
#include "support/fake_services.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace scrobble;
using ScrobbleEngine::ErrorCode;
using test_support::FakeService;

namespace {

Sleeper instantSleeper() {
    return [](std::chrono::milliseconds) { return true; };
}

DispatchEvent scrobbleEvent() {
    ScrobbleEvent e;
    e.track = Track{"Song", "Artist", std::string("Album"), 200};
    e.startedAt = Clock::time_point(std::chrono::seconds(1700000000));
    e.sourceAppId = "spotify";
    return DispatchEvent::fromScrobble(e);
}

DispatchEvent nowPlayingEvent() {
    NowPlayingEvent e;
    e.track = Track{"Song", "Artist", std::nullopt, 200};
    return DispatchEvent::fromNowPlaying(e);
}

class ThrowingService : public FakeService {
   public:
    ThrowingService() : FakeService("throwing") {}
    ServiceResult updateNowPlaying(const Track&) override {
        throw std::runtime_error("boom");
    }
};

}  // namespace

TEST(DispatcherTest, EventConversion) {
    auto sc = scrobbleEvent();
    EXPECT_EQ(sc.type, DispatchEvent::Type::Scrobble);
    EXPECT_EQ(sc.listenedAt, Clock::time_point(std::chrono::seconds(1700000000)));
    EXPECT_STREQ(dispatchEventTypeToString(sc.type), "scrobble");
    EXPECT_STREQ(dispatchEventTypeToString(DispatchEvent::Type::NowPlaying), "now_playing");
}

TEST(DispatcherTest, EmptyServiceListIsNoop) {
    ScrobbleDispatcher dispatcher(instantSleeper());
    EXPECT_TRUE(dispatcher.dispatch(scrobbleEvent(), {}).empty());
}

TEST(DispatcherTest, RoutesByEventType) {
    auto service = std::make_shared<FakeService>("lb");
    ScrobbleDispatcher dispatcher(instantSleeper());

    dispatcher.dispatch(nowPlayingEvent(), {service});
    dispatcher.dispatch(scrobbleEvent(), {service});

    EXPECT_EQ(service->nowPlayingCalls(), 1);
    EXPECT_EQ(service->scrobbleCalls(), 1);
}

TEST(DispatcherTest, FailingServiceDoesNotAffectOthers) {
    auto good = std::make_shared<FakeService>("good");
    auto bad = std::make_shared<FakeService>("bad");
    bad->setScrobbleResult(FakeService::alwaysFail(ErrorCode::SERVICE_UNAVAILABLE));

    ScrobbleDispatcher dispatcher(instantSleeper());
    auto outcomes = dispatcher.dispatch(scrobbleEvent(), {bad, good});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].serviceId, "bad");
    EXPECT_FALSE(outcomes[0].ok());
    EXPECT_EQ(outcomes[0].retry.attempts, 7);
    EXPECT_EQ(outcomes[1].serviceId, "good");
    EXPECT_TRUE(outcomes[1].ok());
    EXPECT_EQ(good->scrobbleCalls(), 1);
}

TEST(DispatcherTest, EachServiceRetriesWithinItsOwnBudget) {
    auto a = std::make_shared<FakeService>("a");
    auto b = std::make_shared<FakeService>("b");
    a->setNowPlayingResult(FakeService::alwaysFail(ErrorCode::NETWORK_ERROR));
    b->setNowPlayingResult([](int attempt) {
        return attempt < 2 ? ServiceResult::failure(ErrorCode::NETWORK_TIMEOUT, "slow")
                           : ServiceResult::success();
    });

    ScrobbleDispatcher dispatcher(instantSleeper());
    auto outcomes = dispatcher.dispatch(nowPlayingEvent(), {a, b});

    EXPECT_EQ(a->nowPlayingCalls(), 5);
    EXPECT_EQ(b->nowPlayingCalls(), 2);
    EXPECT_TRUE(outcomes[1].ok());
}

TEST(DispatcherTest, ExceptionBecomesInternalError) {
    auto thrower = std::make_shared<ThrowingService>();
    RetryPolicy single;
    single.maxElapsed = std::chrono::milliseconds(0);

    ScrobbleDispatcher dispatcher(instantSleeper(), single, single);
    auto outcomes = dispatcher.dispatch(nowPlayingEvent(), {thrower});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].retry.result.code, ErrorCode::INTERNAL_UNKNOWN);
    EXPECT_EQ(outcomes[0].retry.result.message, "boom");
}

TEST(DispatcherTest, PolicyForSelectsByType) {
    RetryPolicy np;
    np.maxElapsed = std::chrono::milliseconds(1);
    RetryPolicy sc;
    sc.maxElapsed = std::chrono::milliseconds(2);

    ScrobbleDispatcher dispatcher(instantSleeper(), np, sc);
    EXPECT_EQ(dispatcher.policyFor(DispatchEvent::Type::NowPlaying).maxElapsed.count(), 1);
    EXPECT_EQ(dispatcher.policyFor(DispatchEvent::Type::Scrobble).maxElapsed.count(), 2);
}

TEST(DispatcherTest, ServiceKindNames) {
    EXPECT_STREQ(serviceKindToString(ServiceKind::LastFm), "lastfm");
    EXPECT_STREQ(serviceKindToString(ServiceKind::ListenBrainz), "listenbrainz");
}
