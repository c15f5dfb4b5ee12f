#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <gtest/gtest.h>
#include "hls/buffer.hpp"
#include "hls/response.hpp"

// Six one-second parts per segment, one byte each: advance part limit is 3.
#define TEST_SEGMENT_DURATION 6.0
#define TEST_PART_DURATION 1.0
#define TEST_PARTS_PER_SEGMENT 6
#define TEST_WINDOW_SIZE 7

class StreamFixture: public ::testing::Test
{
protected:
    void SetUp() override;

    std::shared_ptr<HLSBuffer> makeBuffer(int windowSize = TEST_WINDOW_SIZE, double partDuration = TEST_PART_DURATION);
    std::shared_ptr<HLSSegment> makeSegment(int sequence, std::vector<std::uint8_t> init = std::vector<std::uint8_t>());
    std::shared_ptr<const HLSPartialSegment> makePart(std::uint8_t firstByte, std::size_t size = 1, bool independent = true);

    void put(int sequence);
    void appendParts(int sequence, int count, std::uint8_t firstByte = 0);
    void seal(int sequence);
    // put + TEST_PARTS_PER_SEGMENT parts + seal
    void addCompleteSegment(int sequence, std::uint8_t firstByte = 0);

    std::shared_ptr<HLSBuffer> buffer;
};

// Collects what a request answered.
class ResponseRecorder
{
public:
    std::function<void(const HLSResponse &)> callback();
    std::size_t count() const;
    const HLSResponse &last() const;
private:
    std::shared_ptr<std::vector<HLSResponse>> responses = std::make_shared<std::vector<HLSResponse>>();
};
