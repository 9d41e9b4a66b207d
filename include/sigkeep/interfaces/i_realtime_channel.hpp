#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
namespace sigkeep::interfaces {
using RealtimeEventHandler = std::function<void(std::string_view payload)>;
class IRealtimeChannel {
public:
    virtual ~IRealtimeChannel() = default;
    virtual uint64_t Subscribe(std::string event, RealtimeEventHandler handler) = 0;
    virtual void Unsubscribe(uint64_t subscription_id) = 0;
};
}
