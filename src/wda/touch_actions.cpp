// =============================================================================
// SimPilot - W3C Pointer Action Sequences Implementation
// =============================================================================
#include "wda/touch_actions.hpp"

namespace simpilot::wda {

using json = nlohmann::json;

PointerSequence tapSequence(int x, int y, int hold_ms) {
    PointerSequence seq;
    seq.steps = {
        PointerStep::move(x, y),
        PointerStep::down(),
        PointerStep::pause(hold_ms),
        PointerStep::up(),
    };
    return seq;
}

PointerSequence doubleTapSequence(int x, int y) {
    PointerSequence seq;
    seq.steps = {
        PointerStep::move(x, y),
        PointerStep::down(),
        PointerStep::pause(kTapHoldMs / 2),
        PointerStep::up(),
        PointerStep::pause(kDoubleTapGapMs),
        PointerStep::down(),
        PointerStep::pause(kTapHoldMs / 2),
        PointerStep::up(),
    };
    return seq;
}

PointerSequence longPressSequence(int x, int y, int hold_ms) {
    return tapSequence(x, y, hold_ms);
}

PointerSequence swipeSequence(int from_x, int from_y, int to_x, int to_y, int duration_ms) {
    PointerSequence seq;
    seq.steps = {
        PointerStep::move(from_x, from_y),
        PointerStep::down(),
        PointerStep::pause(kTapHoldMs),
        PointerStep::move(to_x, to_y, duration_ms),
        PointerStep::up(),
    };
    return seq;
}

json encodeActions(const std::vector<PointerSequence>& sequences) {
    json actions = json::array();
    for (const auto& seq : sequences) {
        json steps = json::array();
        for (const auto& step : seq.steps) {
            switch (step.type) {
                case PointerStep::Type::Move: {
                    json move = {{"type", "pointerMove"}, {"x", step.x}, {"y", step.y}};
                    if (step.duration_ms > 0) move["duration"] = step.duration_ms;
                    steps.push_back(move);
                    break;
                }
                case PointerStep::Type::Down:
                    steps.push_back({{"type", "pointerDown"}, {"button", 0}});
                    break;
                case PointerStep::Type::Pause:
                    steps.push_back({{"type", "pause"}, {"duration", step.duration_ms}});
                    break;
                case PointerStep::Type::Up:
                    steps.push_back({{"type", "pointerUp"}, {"button", 0}});
                    break;
            }
        }
        actions.push_back({
            {"type", "pointer"},
            {"id", seq.id},
            {"parameters", {{"pointerType", "touch"}}},
            {"actions", steps},
        });
    }
    return json{{"actions", actions}};
}

Result<std::vector<PointerSequence>> decodeActions(const json& body) {
    if (!body.is_object() || !body.contains("actions") || !body["actions"].is_array()) {
        return AutomationError(ErrorKind::InvalidArgument, "missing actions array");
    }

    std::vector<PointerSequence> out;
    try {
        for (const auto& source : body["actions"]) {
            if (source.value("type", "") != "pointer") {
                return AutomationError(ErrorKind::InvalidArgument, "non-pointer input source");
            }
            PointerSequence seq;
            seq.id = source.value("id", "");
            for (const auto& item : source.at("actions")) {
                const std::string type = item.value("type", "");
                if (type == "pointerMove") {
                    seq.steps.push_back(PointerStep::move(item.at("x").get<int>(),
                                                          item.at("y").get<int>(),
                                                          item.value("duration", 0)));
                } else if (type == "pointerDown") {
                    seq.steps.push_back(PointerStep::down());
                } else if (type == "pause") {
                    seq.steps.push_back(PointerStep::pause(item.value("duration", 0)));
                } else if (type == "pointerUp") {
                    seq.steps.push_back(PointerStep::up());
                } else {
                    return AutomationError(ErrorKind::InvalidArgument,
                                           "unknown pointer step: " + type);
                }
            }
            out.push_back(std::move(seq));
        }
    } catch (const json::exception& e) {
        return AutomationError(ErrorKind::InvalidArgument,
                               std::string("malformed action sequence: ") + e.what());
    }
    return out;
}

Result<std::pair<int, int>> firstPointerPosition(const PointerSequence& sequence) {
    for (const auto& step : sequence.steps) {
        if (step.type == PointerStep::Type::Move) {
            return std::make_pair(step.x, step.y);
        }
    }
    return AutomationError(ErrorKind::InvalidArgument, "sequence has no pointerMove");
}

} // namespace simpilot::wda
