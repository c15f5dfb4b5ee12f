#include "stream-settings.hpp"
#include <cmath>
#include "error.hpp"

// Keeps values like 3 / 0.3 from landing one ulp above an integer before ceil().
#define ROUNDING_SLACK 0.000001

double HLSStreamSettings::partHoldBack() const
{
    return 3 * partTargetDuration;
}

std::shared_ptr<const HLSStreamSettings> HLSStreamSettings::create(double segmentDuration, double partDuration,
    int windowSize, GError **error)
{
    if (!(segmentDuration > 0) || !(partDuration > 0))
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_INVALID_SETTINGS,
            "segment duration %g and part duration %g must be positive", segmentDuration, partDuration);
        return std::shared_ptr<const HLSStreamSettings>();
    }
    if (partDuration >= segmentDuration)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_INVALID_SETTINGS,
            "part duration %g must be shorter than segment duration %g", partDuration, segmentDuration);
        return std::shared_ptr<const HLSStreamSettings>();
    }
    if (windowSize < 1)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_INVALID_SETTINGS,
            "window must hold at least one segment, got %d", windowSize);
        return std::shared_ptr<const HLSStreamSettings>();
    }

    std::shared_ptr<HLSStreamSettings> settings = std::make_shared<HLSStreamSettings>();
    settings->segmentDuration = segmentDuration;
    settings->partDuration = partDuration;
    // PART-TARGET is printed with millisecond precision and must not be exceeded by any part.
    settings->partTargetDuration = std::ceil(partDuration * 1000 - ROUNDING_SLACK) / 1000;
    settings->targetDuration = static_cast<int>(std::ceil(segmentDuration - ROUNDING_SLACK));
    if (settings->partTargetDuration < 1)
    {
        settings->hlsAdvancePartLimit = static_cast<int>(std::ceil(3 / settings->partTargetDuration - ROUNDING_SLACK));
    }
    else
    {
        settings->hlsAdvancePartLimit = 3;
    }
    settings->windowSize = windowSize;
    return settings;
}
