#include "fixtures/stream-fixture.hpp"

void StreamFixture::SetUp()
{
    buffer = makeBuffer();
}

std::shared_ptr<HLSBuffer> StreamFixture::makeBuffer(int windowSize, double partDuration)
{
    GError *error = NULL;
    std::shared_ptr<const HLSStreamSettings> settings =
        HLSStreamSettings::create(TEST_SEGMENT_DURATION, partDuration, windowSize, &error);
    EXPECT_TRUE(settings) << (error ? error->message : "");
    g_clear_error(&error);
    return std::make_shared<HLSBuffer>(settings);
}

std::shared_ptr<HLSSegment> StreamFixture::makeSegment(int sequence, std::vector<std::uint8_t> init)
{
    GDateTime *dateTime = g_date_time_new_utc(2021, 1, 1, 0, 0, 6.0 * sequence);
    std::shared_ptr<HLSSegment> segment = std::make_shared<HLSSegment>(sequence, dateTime, init);
    g_date_time_unref(dateTime);
    return segment;
}

std::shared_ptr<const HLSPartialSegment> StreamFixture::makePart(std::uint8_t firstByte, std::size_t size, bool independent)
{
    std::vector<std::uint8_t> data;
    for (std::size_t i = 0; i < size; i++)
    {
        data.push_back(static_cast<std::uint8_t>(firstByte + i));
    }
    return std::make_shared<const HLSPartialSegment>(TEST_PART_DURATION, independent, data);
}

void StreamFixture::put(int sequence)
{
    GError *error = NULL;
    ASSERT_TRUE(buffer->put(makeSegment(sequence), &error)) << error->message;
}

void StreamFixture::appendParts(int sequence, int count, std::uint8_t firstByte)
{
    std::shared_ptr<const HLSSegment> segment = buffer->getSegment(sequence);
    ASSERT_TRUE(segment);
    int index = segment->getPartCount();
    for (int i = 0; i < count; i++, index++)
    {
        GError *error = NULL;
        ASSERT_TRUE(buffer->appendPart(sequence, makePart(static_cast<std::uint8_t>(firstByte + index)), false, &error))
            << error->message;
    }
}

void StreamFixture::seal(int sequence)
{
    GError *error = NULL;
    std::shared_ptr<const HLSSegment> segment = buffer->getSegment(sequence);
    ASSERT_TRUE(segment);
    ASSERT_TRUE(buffer->seal(sequence, segment->getPartCount() * TEST_PART_DURATION, &error)) << error->message;
}

void StreamFixture::addCompleteSegment(int sequence, std::uint8_t firstByte)
{
    put(sequence);
    appendParts(sequence, TEST_PARTS_PER_SEGMENT, firstByte);
    seal(sequence);
}

std::function<void(const HLSResponse &)> ResponseRecorder::callback()
{
    std::shared_ptr<std::vector<HLSResponse>> responses = this->responses;
    return [responses](const HLSResponse &response)
    {
        responses->push_back(response);
    };
}

std::size_t ResponseRecorder::count() const
{
    return responses->size();
}

const HLSResponse &ResponseRecorder::last() const
{
    return responses->back();
}
