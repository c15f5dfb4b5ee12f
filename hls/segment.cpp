#include "segment.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "error.hpp"

struct HLSSegment::Private
{
    int sequence;
    GDateTime *dateTime;
    std::vector<std::uint8_t> init;
    bool discontinuity;
    bool complete;
    double duration;
    std::size_t dataSize;
    PartMap parts;

    ~Private();
};

HLSSegment::Private::~Private()
{
    if (dateTime)
    {
        g_date_time_unref(dateTime);
    }
}

HLSSegment::HLSSegment(int sequence, GDateTime *dateTime, std::vector<std::uint8_t> init):
    priv(std::make_shared<Private>())
{
    priv->sequence = sequence;
    priv->dateTime = dateTime ? g_date_time_ref(dateTime) : g_date_time_new_now_utc();
    priv->init = std::move(init);
    priv->discontinuity = false;
    priv->complete = false;
    priv->duration = 0;
    priv->dataSize = 0;
}

HLSSegment::~HLSSegment()
{

}

int HLSSegment::getSequence() const
{
    return priv->sequence;
}

std::string HLSSegment::getProgramDateTime() const
{
    GDateTime *utc = g_date_time_to_utc(priv->dateTime);
    gchar *formattedDateTime = g_date_time_format(utc, "%Y-%m-%dT%H:%M:%S");
    std::stringstream ss;
    ss << formattedDateTime << "." << std::setw(3) << std::setfill('0') <<
        g_date_time_get_microsecond(utc) / 1000 << "Z";
    g_free(formattedDateTime);
    g_date_time_unref(utc);
    return ss.str();
}

const std::vector<std::uint8_t> &HLSSegment::getInit() const
{
    return priv->init;
}

bool HLSSegment::isDiscontinuity() const
{
    return priv->discontinuity;
}

bool HLSSegment::isComplete() const
{
    return priv->complete;
}

double HLSSegment::getDuration() const
{
    return priv->duration;
}

std::size_t HLSSegment::getDataSize() const
{
    return priv->dataSize;
}

int HLSSegment::getPartCount() const
{
    return static_cast<int>(priv->parts.size());
}

HLSSegment::PartMap HLSSegment::getParts() const
{
    return priv->parts;
}

std::shared_ptr<const HLSPartialSegment> HLSSegment::getPartialSegment(int index) const
{
    if (index < 0 || index >= getPartCount())
    {
        return std::shared_ptr<const HLSPartialSegment>();
    }
    PartMap::const_iterator it = priv->parts.begin();
    std::advance(it, index);
    return it->second;
}

std::vector<std::uint8_t> HLSSegment::getData(std::uint64_t start, std::uint64_t last) const
{
    std::vector<std::uint8_t> data;
    if (start >= priv->dataSize || last < start)
    {
        return data;
    }
    last = std::min<std::uint64_t>(last, priv->dataSize - 1);
    data.reserve(last - start + 1);

    // First part whose range contains start.
    PartMap::const_iterator it = priv->parts.upper_bound(start);
    --it;
    for (; it != priv->parts.end() && it->first <= last; ++it)
    {
        const std::vector<std::uint8_t> &partData = it->second->data;
        std::uint64_t from = std::max<std::uint64_t>(start, it->first) - it->first;
        std::uint64_t to = std::min<std::uint64_t>(last, it->first + partData.size() - 1) - it->first;
        data.insert(data.end(), partData.begin() + static_cast<std::ptrdiff_t>(from),
            partData.begin() + static_cast<std::ptrdiff_t>(to + 1));
    }
    return data;
}

std::vector<std::uint8_t> HLSSegment::getData() const
{
    if (priv->dataSize == 0)
    {
        return std::vector<std::uint8_t>();
    }
    return getData(0, priv->dataSize - 1);
}

bool HLSSegment::appendPart(std::shared_ptr<const HLSPartialSegment> part, GError **error)
{
    if (priv->complete)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_SEALED_SEGMENT,
            "segment %d is sealed, part of %zu bytes rejected", priv->sequence, part->size());
        return false;
    }
    if (part->size() == 0)
    {
        // An empty part would share its offset with the next one.
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_EMPTY_PART,
            "empty part rejected for segment %d", priv->sequence);
        return false;
    }
    priv->parts[priv->dataSize] = part;
    priv->dataSize += part->size();
    return true;
}

bool HLSSegment::seal(double duration, GError **error)
{
    if (priv->complete)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_SEALED_SEGMENT,
            "segment %d is already sealed", priv->sequence);
        return false;
    }
    priv->duration = duration;
    priv->complete = true;
    return true;
}

void HLSSegment::markDiscontinuity()
{
    priv->discontinuity = true;
}
