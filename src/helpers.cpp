#include "scorebook/helpers.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <google/protobuf/util/message_differencer.h>

namespace scorebook {
namespace helpers {

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::string new_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    const char* pattern = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";

    std::string id;
    id.reserve(36);
    for (const char* p = pattern; *p; ++p) {
        if (*p == 'x') {
            id.push_back(hex_chars[nibble(rng)]);
        } else if (*p == 'y') {
            id.push_back(hex_chars[(nibble(rng) & 0x3) | 0x8]);
        } else {
            id.push_back(*p);
        }
    }
    return id;
}

int utc_year(const google::protobuf::Timestamp& ts) {
    std::time_t seconds = static_cast<std::time_t>(ts.seconds());
    std::tm tm_val{};
    gmtime_r(&seconds, &tm_val);
    return tm_val.tm_year + 1900;
}

std::string iso8601(const google::protobuf::Timestamp& ts) {
    std::time_t seconds = static_cast<std::time_t>(ts.seconds());
    std::tm tm_val{};
    gmtime_r(&seconds, &tm_val);

    std::stringstream ss;
    ss << std::put_time(&tm_val, "%FT%TZ");
    return ss.str();
}

bool same_play(const v1::GameEvent& a, const v1::GameEvent& b) {
    google::protobuf::util::MessageDifferencer differencer;
    const auto* descriptor = v1::GameEvent::descriptor();
    differencer.IgnoreField(descriptor->FindFieldByName("id"));
    differencer.IgnoreField(descriptor->FindFieldByName("timestamp"));
    return differencer.Compare(a, b);
}

std::string event_kind_name(v1::EventKind kind) {
    switch (kind) {
        case v1::EVENT_KIND_SINGLE: return "single";
        case v1::EVENT_KIND_DOUBLE: return "double";
        case v1::EVENT_KIND_TRIPLE: return "triple";
        case v1::EVENT_KIND_HOMERUN: return "homerun";
        case v1::EVENT_KIND_STRIKE: return "strike";
        case v1::EVENT_KIND_ERROR: return "error";
        case v1::EVENT_KIND_STRIKEOUT: return "strikeout";
        case v1::EVENT_KIND_CAUGHT_OUT: return "caught_out";
        case v1::EVENT_KIND_STEAL_SUCCESS: return "steal_success";
        case v1::EVENT_KIND_STEAL_FAIL: return "steal_fail";
        default: return "unspecified";
    }
}

std::string half_name(v1::Half half) {
    switch (half) {
        case v1::HALF_TOP: return "top";
        case v1::HALF_BOTTOM: return "bottom";
        default: return "unspecified";
    }
}

int bases_for(v1::EventKind kind) {
    switch (kind) {
        case v1::EVENT_KIND_SINGLE: return 1;
        case v1::EVENT_KIND_DOUBLE: return 2;
        case v1::EVENT_KIND_TRIPLE: return 3;
        case v1::EVENT_KIND_HOMERUN: return 4;
        default: return 0;
    }
}

} // namespace helpers
} // namespace scorebook
