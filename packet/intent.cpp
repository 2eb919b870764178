#include "packet/intent.hpp"

namespace fdp
{

std::optional<Intent> intent_from_u8(uint8_t code)
{
    switch (static_cast<Intent>(code))
    {
        case Intent::Ping:
        case Intent::Pong:
        case Intent::HandshakeInit:
        case Intent::HandshakeAck:
        case Intent::Close:
        case Intent::Search:
        case Intent::SearchSuggest:
        case Intent::FetchDocument:
        case Intent::SearchStream:
        case Intent::DataRequest:
        case Intent::DataPush:
        case Intent::DataDelta:
        case Intent::DataVerify:
        case Intent::RankingUpdate:
        case Intent::RankingRequest:
        case Intent::CacheQuery:
        case Intent::CacheInvalidate:
        case Intent::Error:
        case Intent::Success:
            return static_cast<Intent>(code);
    }
    return std::nullopt;
}

std::string_view to_string(Intent i)
{
    switch (i)
    {
        case Intent::Ping:            return "Ping";
        case Intent::Pong:            return "Pong";
        case Intent::HandshakeInit:   return "HandshakeInit";
        case Intent::HandshakeAck:    return "HandshakeAck";
        case Intent::Close:           return "Close";
        case Intent::Search:          return "Search";
        case Intent::SearchSuggest:   return "SearchSuggest";
        case Intent::FetchDocument:   return "FetchDocument";
        case Intent::SearchStream:    return "SearchStream";
        case Intent::DataRequest:     return "DataRequest";
        case Intent::DataPush:        return "DataPush";
        case Intent::DataDelta:       return "DataDelta";
        case Intent::DataVerify:      return "DataVerify";
        case Intent::RankingUpdate:   return "RankingUpdate";
        case Intent::RankingRequest:  return "RankingRequest";
        case Intent::CacheQuery:      return "CacheQuery";
        case Intent::CacheInvalidate: return "CacheInvalidate";
        case Intent::Error:           return "Error";
        case Intent::Success:         return "Success";
    }
    return "Unknown";
}

} // namespace fdp
