#include "sparkworld/world/Entities.hpp"

namespace sparkworld::world {

const char* AgentStatusName(AgentStatus s) noexcept
{
    switch (s)
    {
    case AgentStatus::Alive:    return "alive";
    case AgentStatus::Vanished: return "vanished";
    default:                    return "unknown";
    }
}

const char* BondStatusName(BondStatus s) noexcept
{
    switch (s)
    {
    case BondStatus::Unbonded: return "unbonded";
    case BondStatus::Bonded:   return "bonded";
    case BondStatus::Leader:   return "leader";
    default:                   return "unknown";
    }
}

const char* IntentName(Intent i) noexcept
{
    switch (i)
    {
    case Intent::Idle:         return "idle";
    case Intent::BondRequest:  return "bond-request";
    case Intent::BondAccept:   return "bond-accept";
    case Intent::Raid:         return "raid";
    case Intent::Spawn:        return "spawn";
    case Intent::RequestGrant: return "request-grant";
    case Intent::Message:      return "message";
    default:                   return "unknown";
    }
}

std::optional<AgentStatus> AgentStatusFromName(std::string_view name) noexcept
{
    if (name == "alive")    return AgentStatus::Alive;
    if (name == "vanished") return AgentStatus::Vanished;
    return std::nullopt;
}

std::optional<BondStatus> BondStatusFromName(std::string_view name) noexcept
{
    if (name == "unbonded") return BondStatus::Unbonded;
    if (name == "bonded")   return BondStatus::Bonded;
    if (name == "leader")   return BondStatus::Leader;
    return std::nullopt;
}

std::optional<Intent> IntentFromName(std::string_view name) noexcept
{
    if (name == "idle")          return Intent::Idle;
    if (name == "bond-request")  return Intent::BondRequest;
    if (name == "bond-accept")   return Intent::BondAccept;
    if (name == "raid")          return Intent::Raid;
    if (name == "spawn")         return Intent::Spawn;
    if (name == "request-grant") return Intent::RequestGrant;
    if (name == "message")       return Intent::Message;
    return std::nullopt;
}

} // namespace sparkworld::world
