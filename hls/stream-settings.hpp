#pragma once
#include <memory>
#include <glib.h>

struct HLSStreamSettings
{
    double segmentDuration;
    double partDuration;
    double partTargetDuration;
    int targetDuration;
    int hlsAdvancePartLimit;
    int windowSize;

    double partHoldBack() const;

    static std::shared_ptr<const HLSStreamSettings> create(double segmentDuration, double partDuration,
        int windowSize, GError **error);
};
