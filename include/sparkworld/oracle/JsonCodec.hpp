#pragma once
// include/sparkworld/oracle/JsonCodec.hpp
//
// JSON wire format between the core and a remote decision service, plus
// oracle adapters that speak it over a caller-supplied transport.
//
// Decoding is tolerant: unknown intents become idle, a missing / null /
// "None" / empty / non-string target means "no target", and the short verbs
// of the service ("bond", "reply", "request_spark") map onto the closed
// intent set.

#include "sparkworld/oracle/Oracles.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <utility>
#include <stop_token>
#include <vector>

namespace sparkworld::oracle {

using json = nlohmann::json;

[[nodiscard]] json ObservationToJson(const Observation& obs);

// `context` (the observation the decision answered) lets "reply" resolve to
// an accept when the target has a bond request waiting in the inbox.
[[nodiscard]] Decision DecisionFromJson(const json& j, const Observation* context = nullptr);

[[nodiscard]] json GrantRequestsToJson(int balance, world::Tick tick, const std::vector<GrantRequest>& requests);
[[nodiscard]] std::vector<GrantDecision> GrantDecisionsFromJson(const json& j);

// Sends one request document, returns the response document. May throw.
using JsonTransport = std::function<json(const json& request, std::stop_token stop)>;

class JsonDecisionOracle final : public IDecisionOracle {
public:
    explicit JsonDecisionOracle(JsonTransport transport) : m_transport(std::move(transport)) {}
    Decision Decide(const world::AgentId& agentId, const Observation& obs, std::stop_token stop) override;

private:
    JsonTransport m_transport;
};

class JsonBenefactorOracle final : public IBenefactorOracle {
public:
    explicit JsonBenefactorOracle(JsonTransport transport) : m_transport(std::move(transport)) {}
    std::vector<GrantDecision> DecideGrants(int balance, world::Tick tick,
                                            const std::vector<GrantRequest>& requests,
                                            std::stop_token stop) override;

private:
    JsonTransport m_transport;
};

} // namespace sparkworld::oracle
