#include <gtest/gtest.h>
#include <libsoup/soup.h>
#include "fixtures/stream-fixture.hpp"
#include "hls/playlist-request.hpp"

class PlaylistRequestTest: public StreamFixture
{
protected:
    std::shared_ptr<HLSPlaylistRequest> request(int msn, int part)
    {
        std::shared_ptr<HLSPlaylistRequest> request =
            std::make_shared<HLSPlaylistRequest>(buffer, msn, part, recorder.callback());
        request->dispatch();
        return request;
    }

    guint status(int msn, int part)
    {
        ResponseRecorder single;
        std::shared_ptr<HLSPlaylistRequest> request =
            std::make_shared<HLSPlaylistRequest>(buffer, msn, part, single.callback());
        request->dispatch();
        if (!single.count())
        {
            request->cancel();
            return 0;
        }
        return single.last().status;
    }

    ResponseRecorder recorder;
};

TEST_F(PlaylistRequestTest, PlainReloadIsServed)
{
    addCompleteSegment(0);
    request(-1, -1);
    ASSERT_EQ(recorder.count(), 1u);
    EXPECT_EQ(recorder.last().status, SOUP_STATUS_OK);
    EXPECT_EQ(recorder.last().contentType, HLS_PLAYLIST_CONTENT_TYPE);
    EXPECT_EQ(recorder.last().playlist, HLSPlaylist::render(*buffer));
}

TEST_F(PlaylistRequestTest, PlainReloadWaitsForFirstSegment)
{
    std::shared_ptr<HLSPlaylistRequest> pending = request(-1, -1);
    EXPECT_EQ(recorder.count(), 0u);
    EXPECT_TRUE(pending->isBlocked());
    put(0);
    ASSERT_EQ(recorder.count(), 1u);
    EXPECT_EQ(recorder.last().status, SOUP_STATUS_OK);
    EXPECT_FALSE(pending->isBlocked());
}

TEST_F(PlaylistRequestTest, PartWithoutSequenceIsBadRequest)
{
    addCompleteSegment(0);
    EXPECT_EQ(status(-1, 0), SOUP_STATUS_BAD_REQUEST);
}

TEST_F(PlaylistRequestTest, SequenceTooFarAheadIsBadRequest)
{
    EXPECT_EQ(status(1, -1), SOUP_STATUS_BAD_REQUEST);
    addCompleteSegment(0);
    EXPECT_EQ(status(2, -1), SOUP_STATUS_BAD_REQUEST);
    EXPECT_EQ(status(2, 0), SOUP_STATUS_BAD_REQUEST);
}

TEST_F(PlaylistRequestTest, NextSegmentBlocksUntilPut)
{
    addCompleteSegment(0);
    request(1, -1);
    EXPECT_EQ(recorder.count(), 0u);
    put(1);
    ASSERT_EQ(recorder.count(), 1u);
    EXPECT_EQ(recorder.last().status, SOUP_STATUS_OK);
    EXPECT_NE(recorder.last().playlist.find("/api/segments/1.ts\",BYTERANGE-START=0"), std::string::npos);
}

TEST_F(PlaylistRequestTest, ResponseNeverLooksAhead)
{
    put(0);
    appendParts(0, 2);
    request(0, 3);
    appendParts(0, 1);
    EXPECT_EQ(recorder.count(), 0u);
    appendParts(0, 1);
    ASSERT_EQ(recorder.count(), 1u);
    const std::string &playlist = recorder.last().playlist;
    EXPECT_NE(playlist.find("BYTERANGE=\"1@3\""), std::string::npos);
    EXPECT_EQ(playlist.find("BYTERANGE=\"1@4\""), std::string::npos);
}

TEST_F(PlaylistRequestTest, AvailablePartIsServedImmediately)
{
    put(0);
    appendParts(0, 3);
    EXPECT_EQ(status(0, 2), SOUP_STATUS_OK);
    EXPECT_EQ(status(0, 0), SOUP_STATUS_OK);
}

TEST_F(PlaylistRequestTest, PartLimitOnLiveSegment)
{
    put(0);
    appendParts(0, 2);
    // Parts 0..1 exist; limit 3 allows waiting up to part 3.
    EXPECT_EQ(status(0, 3), 0u);
    EXPECT_EQ(status(0, 4), SOUP_STATUS_BAD_REQUEST);
    EXPECT_EQ(buffer->waiters().size(), 0u);
}

TEST_F(PlaylistRequestTest, PartLimitOnNextSegment)
{
    addCompleteSegment(0);
    EXPECT_EQ(status(1, 1), 0u);
    EXPECT_EQ(status(1, 2), SOUP_STATUS_BAD_REQUEST);
}

TEST_F(PlaylistRequestTest, RolloverIsEquivalentToNextSegment)
{
    addCompleteSegment(0);
    addCompleteSegment(1);
    put(2);

    ResponseRecorder rolled;
    std::shared_ptr<HLSPlaylistRequest> first =
        std::make_shared<HLSPlaylistRequest>(buffer, 1, TEST_PARTS_PER_SEGMENT, rolled.callback());
    first->dispatch();
    ResponseRecorder direct;
    std::shared_ptr<HLSPlaylistRequest> second =
        std::make_shared<HLSPlaylistRequest>(buffer, 2, 0, direct.callback());
    second->dispatch();
    EXPECT_EQ(rolled.count(), 0u);
    EXPECT_EQ(direct.count(), 0u);

    appendParts(2, 1);
    ASSERT_EQ(rolled.count(), 1u);
    ASSERT_EQ(direct.count(), 1u);
    EXPECT_EQ(rolled.last().playlist, direct.last().playlist);

    EXPECT_EQ(status(1, TEST_PARTS_PER_SEGMENT), SOUP_STATUS_OK);
}

TEST_F(PlaylistRequestTest, WaitsForPartOnLiveSegment)
{
    addCompleteSegment(0);
    put(1);
    appendParts(1, 5);
    request(1, 5);
    EXPECT_EQ(recorder.count(), 0u);

    appendParts(1, 1);
    ASSERT_EQ(recorder.count(), 1u);
    EXPECT_EQ(recorder.last().status, SOUP_STATUS_OK);
    const std::string &playlist = recorder.last().playlist;
    for (int i = 0; i <= 5; i++)
    {
        std::string byteRange = "BYTERANGE=\"1@" + std::to_string(i) + "\"";
        EXPECT_NE(playlist.find(byteRange), std::string::npos) << byteRange;
    }
    EXPECT_NE(playlist.find("#EXT-X-PRELOAD-HINT:TYPE=PART,URI=\"/api/segments/1.ts\",BYTERANGE-START=6"),
        std::string::npos);
}

TEST_F(PlaylistRequestTest, EvictedSequenceIsNotFound)
{
    buffer = makeBuffer(2);
    addCompleteSegment(0);
    addCompleteSegment(1);
    put(2);
    EXPECT_EQ(status(0, -1), SOUP_STATUS_NOT_FOUND);
    EXPECT_EQ(status(0, 2), SOUP_STATUS_NOT_FOUND);
    EXPECT_EQ(status(1, -1), SOUP_STATUS_OK);
}

TEST_F(PlaylistRequestTest, StopReleasesBlockedRequests)
{
    put(0);
    request(0, 1);
    request(1, -1);
    buffer->stop();
    EXPECT_EQ(recorder.count(), 2u);
    EXPECT_EQ(recorder.last().status, SOUP_STATUS_NOT_FOUND);
    EXPECT_EQ(status(0, -1), SOUP_STATUS_NOT_FOUND);
}

TEST_F(PlaylistRequestTest, CancelLeavesNoWaiter)
{
    put(0);
    std::shared_ptr<HLSPlaylistRequest> pending = request(0, 1);
    EXPECT_EQ(buffer->waiters().size(), 1u);
    pending->cancel();
    EXPECT_TRUE(pending->isProcessed());
    EXPECT_EQ(buffer->waiters().size(), 0u);
    appendParts(0, 2);
    EXPECT_EQ(recorder.count(), 0u);
}

TEST_F(PlaylistRequestTest, SequenceDirectiveAfterThreeSegments)
{
    addCompleteSegment(0);
    addCompleteSegment(1);
    addCompleteSegment(2);
    EXPECT_EQ(status(0, -1), SOUP_STATUS_OK);
    EXPECT_EQ(status(2, -1), SOUP_STATUS_OK);
    EXPECT_EQ(status(3, -1), 0u);
    EXPECT_EQ(status(4, -1), SOUP_STATUS_BAD_REQUEST);
    EXPECT_EQ(status(5, -1), SOUP_STATUS_BAD_REQUEST);
    EXPECT_EQ(buffer->waiters().size(), 0u);
}

TEST_F(PlaylistRequestTest, RolloverSurvivesEvictionOfItsSegment)
{
    buffer = makeBuffer(1);
    put(0);
    appendParts(0, 2);

    ResponseRecorder rolled;
    std::shared_ptr<HLSPlaylistRequest> first =
        std::make_shared<HLSPlaylistRequest>(buffer, 0, 2, rolled.callback());
    first->dispatch();
    ResponseRecorder direct;
    std::shared_ptr<HLSPlaylistRequest> second =
        std::make_shared<HLSPlaylistRequest>(buffer, 1, 0, direct.callback());
    second->dispatch();

    seal(0);
    put(1);
    EXPECT_EQ(rolled.count(), 0u);
    EXPECT_EQ(direct.count(), 0u);

    appendParts(1, 1);
    ASSERT_EQ(rolled.count(), 1u);
    ASSERT_EQ(direct.count(), 1u);
    EXPECT_EQ(rolled.last().status, SOUP_STATUS_OK);
    EXPECT_EQ(direct.last().status, SOUP_STATUS_OK);
    EXPECT_EQ(rolled.last().playlist, direct.last().playlist);
}
